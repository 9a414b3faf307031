#include <sys/wait.h>

#include <cerrno> // for errno, EINTR, ECHILD

#include "berth/wait_result.hpp"

namespace berth {

auto operator<<(std::ostream& os, const empty_wait_result&)
    -> std::ostream&
{
    os << "empty wait result";
    return os;
}

auto operator<<(std::ostream& os, const nokids_wait_result&)
    -> std::ostream&
{
    os << "no child processes to wait for";
    return os;
}

auto operator<<(std::ostream& os, const error_wait_result& arg)
    -> std::ostream&
{
    os << arg.data;
    return os;
}

auto operator<<(std::ostream& os, const info_wait_result& arg)
    -> std::ostream&
{
    os << arg.id << ", " << arg.status;
    return os;
}

auto wait(reference_process_id id, wait_option flags) noexcept
    -> wait_result
{
    auto status = 0;
    auto pid = decltype(::waitpid(pid_t(id), &status, int(flags))){};
    auto err = 0;
    for (;;) {
        pid = ::waitpid(pid_t(id), &status, int(flags));
        err = errno;
        if ((pid != -1) || (err != EINTR)) {
            break;
        }
    }
    if (pid < 0) { // treat all negatives as error
        if (err == ECHILD) {
            return nokids_wait_result{};
        }
        return error_wait_result{os_error_code(err)};
    }
    if (pid == 0) {
        return empty_wait_result{};
    }
    if (WIFEXITED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_exit_status{WEXITSTATUS(status)}};
    }
    if (WIFSIGNALED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_signaled_status{WTERMSIG(status), WCOREDUMP(status) != 0}};
    }
    if (WIFSTOPPED(status)) {
        // Only reported if WUNTRACED was given or the child is traced.
        return info_wait_result{reference_process_id{pid},
            wait_stopped_status{WSTOPSIG(status)}};
    }
    if (WIFCONTINUED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_continued_status{}};
    }
    return info_wait_result{reference_process_id{pid}};
}

}
