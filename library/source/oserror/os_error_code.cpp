#if defined(_WIN32)
#include <windows.h> // for GetLastError
#endif

#include <cerrno> // for errno
#include <sstream> // for std::ostringstream

#include "oserror/os_error_code.hpp"
#include "oserror/utility.hpp"

namespace oserror {

#if defined(_WIN32)
static_assert(sizeof(DWORD) == sizeof(std::underlying_type_t<os_error_code>));
#endif

auto last_os_error() noexcept -> os_error_code
{
#if defined(_WIN32)
    return os_error_code(static_cast<int>(::GetLastError()));
#else
    return os_error_code{errno};
#endif
}

auto kind(os_error_code err) noexcept -> std::error_condition
{
    return std::system_category().default_error_condition(code(err));
}

auto make_error_code(os_error_code err) noexcept -> std::error_code
{
    return std::error_code{code(err), std::system_category()};
}

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&
{
    return write(os, make_error_code(err));
}

auto to_string(os_error_code err) -> std::string
{
    std::ostringstream os;
    os << err;
    return os.str();
}

auto write_debug(std::ostream& os, os_error_code err)
    -> std::ostream&
{
    os << "os_error_code{code: " << code(err) << ", kind: ";
    write(os, kind(err));
    os << "}";
    return os;
}

auto to_debug_string(os_error_code err) -> std::string
{
    std::ostringstream os;
    write_debug(os, err);
    return os.str();
}

}
