#include "oserror/io_error.hpp"

namespace oserror {

auto to_os_error_code(const std::error_code& ec) noexcept
    -> os_error_result
{
    if (ec.category() != std::system_category()) {
        return std::unexpected{not_an_os_error{}};
    }
    return os_error_code{ec.value()};
}

auto to_os_error_code(const std::system_error& ex) noexcept
    -> os_error_result
{
    return to_os_error_code(ex.code());
}

auto to_error_code(os_error_code err) noexcept -> std::error_code
{
    return make_error_code(err);
}

auto to_system_error(os_error_code err, const std::string& what)
    -> std::system_error
{
    return std::system_error{to_error_code(err), what};
}

[[noreturn]]
auto throw_error(os_error_code err, const std::string& what) -> void
{
    throw to_system_error(err, what);
}

}
