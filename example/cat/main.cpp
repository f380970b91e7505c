#include <fmt/format.h>

#include <slurp/exception.hpp>
#include <slurp/file_transfer.hpp>
#include <slurp/log.hpp>

#include <clipp.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

/*
 * Prints the content of a file to stdout.
 *
 * By default the whole file is decoded at once. With --lines the file is
 * read lazily, one line at a time, and every line is printed with its number.
 * The encoding is detected from the byte order mark; files without one are
 * decoded using the encoding given by --encoding (utf-8 by default).
 */

namespace {

struct settings {
    std::string file;
    std::string encoding = "utf-8";
    bool lines = false;
    bool verbose = false;
};

const slurp::text_codec* find_codec(const std::string& name) {
    if (name == "utf-8")
        return &slurp::utf8();
    if (name == "utf-16le")
        return &slurp::utf16le();
    if (name == "utf-16be")
        return &slurp::utf16be();
    if (name == "utf-32le")
        return &slurp::utf32le();
    if (name == "utf-32be")
        return &slurp::utf32be();
    if (name == "latin-1")
        return &slurp::latin1();
    return nullptr;
}

void parse(settings& s, int argc, char** argv) {
    using namespace clipp;

    bool show_help = false;

    auto cli = (
        value("file", s.file)                                       % "the file to print",
        (option("-e", "--encoding") & value("name", s.encoding))    % "encoding of files without a byte order mark (default: utf-8)",
        option("-l", "--lines").set(s.lines)                        % "read the file line by line",
        option("-v", "--verbose").set(s.verbose)                    % "enable debug logging"
    ) | option("-h", "--help").set(show_help);

    parsing_result result = parse(argc, argv, cli);
    if (show_help || !result) {
        std::cout << "Usage:\n"
                  << usage_lines(cli, argv[0], doc_formatting().start_column(4)) << "\n\n"
                  << documentation(cli) << "\n";
        std::exit(1);
    }
}

} // namespace

int main(int argc, char** argv) {
    settings s;
    parse(s, argc, argv);

    if (s.verbose)
        slurp::set_log_level(slurp::log_level::debug);

    const slurp::text_codec* codec = find_codec(s.encoding);
    if (!codec) {
        fmt::print(stderr, "Unknown encoding `{}`.\n", s.encoding);
        return 1;
    }

    try {
        slurp::file_transfer transfer;
        if (!s.lines) {
            fmt::print("{}", transfer.read_all_text(s.file.c_str(), *codec));
            return 0;
        }

        slurp::line_reader reader = transfer.read_lines(s.file.c_str(), *codec);
        size_t number = 0;
        for (const std::string& line : reader)
            fmt::print("{:>6}  {}\n", ++number, line);
    } catch (const slurp::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
    return 0;
}
