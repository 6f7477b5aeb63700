#ifndef os_error_code_hpp
#define os_error_code_hpp

#include <ostream>
#include <string>
#include <system_error> // for std::error_code, std::is_error_code_enum

#include "oserror/utility.hpp"

namespace oserror {

/// @brief Operating system error code.
/// @details Strong type wrapping the raw integer a system call failure
///   reports: <code>errno</code> on POSIX, <code>GetLastError()</code> on
///   Windows. Any integer is accepted verbatim. Equality, ordering, and
///   <code>std::hash</code> all follow the raw integer.
/// @note Values are only meaningfully comparable on the same platform. The
///   same integer names different errors on different systems.
enum class os_error_code: int;

/// @brief Gets the raw platform code held by the given value.
constexpr auto code(os_error_code err) noexcept -> int
{
    return to_underlying(err);
}

/// @brief Gets the calling thread's most recent OS error.
/// @note Read this immediately after the failing call. Intervening library
///   calls may overwrite it.
auto last_os_error() noexcept -> os_error_code;

/// @brief Gets the portable condition the platform maps the code to.
/// @details Compare the result against <code>std::errc</code> values.
auto kind(os_error_code err) noexcept -> std::error_condition;

/// @brief Makes the generic error code wrapping the given OS error code.
/// @note This is what <code>std::error_code</code>'s converting constructor
///   finds by argument dependent lookup.
auto make_error_code(os_error_code err) noexcept -> std::error_code;

/// @brief Writes the generic error code form followed by the platform's
///   message for it, e.g. <code>system:2 (No such file or directory)</code>.
auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_string(os_error_code err) -> std::string;

/// @brief Writes an unambiguous form exposing the literal code, e.g.
///   <code>os_error_code{code: 2, kind: generic:2}</code>.
auto write_debug(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_debug_string(os_error_code err) -> std::string;

}

namespace std {
template <>
struct is_error_code_enum<oserror::os_error_code>: true_type {};
}

#endif /* os_error_code_hpp */
