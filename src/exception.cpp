#include <slurp/exception.hpp>

#include <cerrno>

namespace slurp {

io_error errno_error(const std::string& what) {
    std::error_code ec(errno, std::system_category());
    return io_error(fmt::format("{}: {}.", what, ec.message()), ec);
}

} // namespace slurp
