#include <sys/wait.h> // for WNOHANG

#include "berth/wait_option.hpp"

namespace berth::wait_options {

auto nohang() noexcept -> wait_option
{
    return wait_option(WNOHANG);
}

}
