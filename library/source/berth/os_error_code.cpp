#include <cerrno> // for errno
#include <sstream>
#include <system_error>

#include "berth/os_error_code.hpp"
#include "berth/utility.hpp"

namespace berth {

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&
{
    return write(os, std::error_code{int(err), std::system_category()});
}

auto to_string(os_error_code err) -> std::string
{
    std::ostringstream os;
    os << err;
    return os.str();
}

auto last_os_error_code() noexcept -> os_error_code
{
    return os_error_code{errno};
}

}
