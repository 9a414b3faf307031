#include "berth/wait_status.hpp"

namespace berth {

auto operator<<(std::ostream& os, const wait_unknown_status&) -> std::ostream&
{
    os << "unknown-status";
    return os;
}

auto operator<<(std::ostream& os, const wait_exit_status& value) -> std::ostream&
{
    os << "exit-status=" << value.value;
    return os;
}

auto operator<<(std::ostream& os, const wait_signaled_status& value) -> std::ostream&
{
    os << "signal=" << value.signal;
    os << ", core-dumped=" << std::boolalpha << value.core_dumped;
    return os;
}

auto operator<<(std::ostream& os, const wait_stopped_status& value) -> std::ostream&
{
    os << "stop-signal=" << value.stop_signal;
    return os;
}

auto operator<<(std::ostream& os, const wait_continued_status&) -> std::ostream&
{
    os << "continued";
    return os;
}

auto is_terminated(const wait_status& value) noexcept -> bool
{
    return std::holds_alternative<wait_exit_status>(value)
        || std::holds_alternative<wait_signaled_status>(value);
}

auto is_success(const wait_status& value) noexcept -> bool
{
    const auto p = std::get_if<wait_exit_status>(&value);
    return p && (p->value == 0);
}

}
