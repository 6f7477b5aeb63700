#include "oserror/not_an_os_error.hpp"

namespace oserror {

auto operator<<(std::ostream& os, const not_an_os_error&)
    -> std::ostream&
{
    os << "not an OS error";
    return os;
}

}
