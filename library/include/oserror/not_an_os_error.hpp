#ifndef not_an_os_error_hpp
#define not_an_os_error_hpp

#include <concepts> // for std::regular.
#include <ostream>

namespace oserror {

/// @brief Condition of a generic error that carries no OS error code.
/// @see to_os_error_code.
struct not_an_os_error {
    constexpr auto operator<=>(const not_an_os_error&) const noexcept =
        default;
};

static_assert(std::regular<not_an_os_error>);

auto operator<<(std::ostream& os, const not_an_os_error&)
    -> std::ostream&;

}

#endif /* not_an_os_error_hpp */
