#include <csignal>
#include <string> // for std::to_string

#include "berth/signal.hpp"

namespace berth {

auto operator<<(std::ostream& os, signal s) -> std::ostream&
{
    switch (int(s)) {
    case SIGINT:
        os << "sigint";
        break;
    case SIGTERM:
        os << "sigterm";
        break;
    case SIGKILL:
        os << "sigkill";
        break;
    case SIGCHLD:
        os << "sigchild";
        break;
    default:
        os << "signal-#" << std::to_string(int(s));
        break;
    }
    return os;
}

}

namespace berth::signals {

auto terminate() noexcept -> signal
{
    return signal{SIGTERM};
}

auto kill() noexcept -> signal
{
    return signal{SIGKILL};
}

}
