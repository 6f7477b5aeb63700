#include "oserror/utility.hpp"

namespace oserror {

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&
{
    os << ec << " (" << ec.message() << ")";
    return os;
}

auto write(std::ostream& os, const std::error_condition& ec)
    -> std::ostream&
{
    os << ec.category().name() << ':' << ec.value();
    return os;
}

}
