#ifndef utility_hpp
#define utility_hpp

#include <ostream>
#include <system_error> // for std::error_code
#include <type_traits> // for std::underlying_type_t

namespace oserror {

/// @brief Writes the code followed by its message in parentheses.
auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&;

/// @brief Writes the condition as <code>category:value</code>.
/// @note Unlike the <code>std::error_code</code> overload, this doesn't
///   look up any message.
auto write(std::ostream& os, const std::error_condition& ec)
    -> std::ostream&;

/// @brief Converts the given enumerate into its underlying value.
/// @note This is basically a back port from C++23.
template <class Enum>
constexpr auto to_underlying(Enum e) noexcept ->
    decltype(static_cast<std::underlying_type_t<Enum>>(e))
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

}

#endif /* utility_hpp */
