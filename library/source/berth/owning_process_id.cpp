#include <unistd.h> // for pid_t, fork

#include <iostream> // for std::cerr
#include <utility> // for std::exchange

#include "berth/owning_process_id.hpp"
#include "berth/wait_result.hpp"

namespace berth {

auto owning_process_id::fork() -> reference_process_id
{
    return reference_process_id{::fork()};
}

owning_process_id::owning_process_id(reference_process_id id) noexcept:
    pid{(id <= no_process_id)? default_process_id: id}
{
    // Intentionally empty.
}

owning_process_id::owning_process_id(owning_process_id&& other) noexcept:
    pid{std::exchange(other.pid, default_process_id)},
    last_status{std::exchange(other.last_status, default_status)}
{
    // Intentionally empty.
}

owning_process_id::~owning_process_id()
{
    reap();
}

auto owning_process_id::operator=(owning_process_id&& other) noexcept
    -> owning_process_id&
{
    if (this != &other) {
        reap();
        pid = std::exchange(other.pid, default_process_id);
        last_status = std::exchange(other.last_status, default_status);
    }
    return *this;
}

owning_process_id::operator reference_process_id() const noexcept
{
    return pid;
}

auto owning_process_id::operator<=>(const owning_process_id& other) const noexcept
{
    return pid <=> other.pid;
}

auto owning_process_id::status() const noexcept -> wait_status
{
    return last_status;
}

auto owning_process_id::wait(wait_option flags) noexcept -> wait_status
{
    if (pid <= no_process_id) {
        return last_status;
    }
    const auto result = ::berth::wait(pid, flags);
    if (const auto p = std::get_if<info_wait_result>(&result)) {
        last_status = p->status;
        if (is_terminated(last_status)) {
            pid = default_process_id;
        }
    }
    else if (std::holds_alternative<nokids_wait_result>(result)) {
        // Someone else reaped it; nothing left to own.
        pid = default_process_id;
    }
    else if (const auto p = std::get_if<error_wait_result>(&result)) {
        std::cerr << "wait for " << pid << " failed: " << p->data << "\n";
        pid = default_process_id;
    }
    return last_status;
}

auto owning_process_id::reap() noexcept -> void
{
    while (pid > no_process_id) {
        (void) wait();
    }
}

}
