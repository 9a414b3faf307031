#include <unistd.h> // for close

#include <cerrno> // for errno
#include <utility> // for std::exchange

#include "berth/owning_descriptor.hpp"

namespace berth {

owning_descriptor::~owning_descriptor()
{
    close();
}

owning_descriptor::owning_descriptor(owning_descriptor&& other) noexcept
    : d{std::exchange(other.d, default_descriptor)} {}

auto owning_descriptor::operator=(owning_descriptor&& other) noexcept
    -> owning_descriptor&
{
    if (&other != this) {
        close();
        d = std::exchange(other.d, default_descriptor);
    }
    return *this;
}

auto owning_descriptor::close() noexcept -> os_error_code
{
    if (d != default_descriptor) {
        if (::close(d) == -1) {
            return os_error_code{errno};
        }
        d = default_descriptor;
    }
    return os_error_code{};
}

}
