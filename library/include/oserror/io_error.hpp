#ifndef io_error_hpp
#define io_error_hpp

#include <expected>
#include <string>
#include <system_error>

#include "oserror/not_an_os_error.hpp"
#include "oserror/os_error_code.hpp"

namespace oserror {

/// @brief Result of extracting an OS error code from a generic error.
using os_error_result = std::expected<os_error_code, not_an_os_error>;

/// @brief Gets the OS error code the given generic error code carries.
/// @details Only codes of <code>std::system_category()</code> originate from
///   a failed system call. Codes of any other category, including the
///   <code>std::generic_category()</code> codes that <code>std::errc</code>
///   values make, are reported as <code>not_an_os_error</code>.
auto to_os_error_code(const std::error_code& ec) noexcept
    -> os_error_result;

/// @brief Gets the OS error code the given exception carries.
/// @note Works with any exception derived from <code>std::system_error</code>
///   like <code>std::filesystem::filesystem_error</code> or
///   <code>std::ios_base::failure</code>.
auto to_os_error_code(const std::system_error& ex) noexcept
    -> os_error_result;

/// @brief Makes the generic error code for the given OS error code.
/// @post <code>to_os_error_code(to_error_code(err)) == err</code>.
auto to_error_code(os_error_code err) noexcept -> std::error_code;

auto to_system_error(os_error_code err, const std::string& what = {})
    -> std::system_error;

/// @brief Throws the <code>std::system_error</code> for the given code.
[[noreturn]]
auto throw_error(os_error_code err, const std::string& what) -> void;

}

#endif /* io_error_hpp */
