#include <fcntl.h> // for O_CLOEXEC
#include <pthread.h>
#include <unistd.h> // for pipe2, chdir, execve, _exit

#include <cerrno> // for errno
#include <csignal>
#include <optional>
#include <sstream> // for std::ostringstream

#include "berth/owning_descriptor.hpp"
#include "berth/spawn.hpp"
#include "berth/utility.hpp"

namespace berth {

namespace {

constexpr auto exec_failure_code = 127;

/// @brief Step at which a forked child failed.
enum class child_step: int { chdir = 1, execve = 2 };

/// @brief What the child writes to the status pipe when it fails.
struct child_failure
{
    child_step step{};
    int err{};
};

/// @brief Exit the forked child process.
/// @note We have to be careful how we actually exit. As a C++ library,
///   we need to make sure our normal destructors actually don't get
///   called from this context! Otherwise, things like calling
///   std::future::get can block awaiting a thread that it thinks is
///   running when ::fork() actually doesn't copy threads.
[[noreturn]]
auto exit_child(int exit_code) -> void
{
    ::_exit(exit_code); // NOLINT(concurrency-mt-unsafe)
}

/// @brief Reports the failed step to the parent then exits.
/// @note Only async-signal-safe functions are called.
[[noreturn]]
auto fail_child(int status_fd, child_step step) -> void
{
    const auto failure = child_failure{step, errno};
    while (::write(status_fd, &failure, sizeof(failure)) == -1 &&
           errno == EINTR) {
        // retry
    }
    exit_child(exec_failure_code);
}

/// @brief Reads the child's failure from the status pipe.
/// @return Empty if the pipe was closed by a successful exec.
auto read_child_failure(int status_fd) -> std::optional<child_failure>
{
    auto failure = child_failure{};
    for (;;) {
        const auto n = ::read(status_fd, &failure, sizeof(failure));
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == static_cast<ssize_t>(sizeof(failure))) {
            return failure;
        }
        return {};
    }
}

}

auto resolve_file(const executable& exe, const environment_map& env)
    -> std::filesystem::path
{
    const auto& file = exe.file;
    if (file.empty()) {
        throw spawn_error{"no file specified to execute"};
    }
    if (!file.is_relative() || file.has_parent_path()) {
        return file;
    }
    const auto path_env_value = find(env, env_name{"PATH"});
    if (!path_env_value) {
        std::ostringstream os;
        os << "no PATH to find file " << file;
        throw spawn_error{os.str()};
    }
    const auto found = find_file(file, *path_env_value);
    if (!found) {
        std::ostringstream os;
        os << "no such file in PATH as " << file;
        throw spawn_error{os.str()};
    }
    return *found;
}

auto spawn(const executable& exe, const environment_map& env)
    -> owning_process_id
{
    const auto exe_path = resolve_file(exe, env);
    auto arg_buffers = make_arg_bufs(exe.arguments, exe.file.string());
    auto env_buffers = make_arg_bufs(env);
    auto argv = make_argv(arg_buffers);
    auto envp = make_argv(env_buffers);
    const auto dir = exe.working_directory.string();

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        const auto ec = last_os_error_code();
        throw spawn_error{"pipe2 failed: " + to_string(ec), ec};
    }
    auto status_in = owning_descriptor{fds[0]};
    auto status_out = owning_descriptor{fds[1]};

    sigset_t old_set{};
    sigset_t new_set{};
    sigemptyset(&old_set);
    sigemptyset(&new_set);
    sigaddset(&new_set, SIGCHLD);
    pthread_sigmask(SIG_BLOCK, &new_set, &old_set);
    const auto pid = owning_process_id::fork();
    switch (pid) {
    case invalid_process_id: {
        const auto ec = last_os_error_code();
        pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
        throw spawn_error{"fork failed: " + to_string(ec), ec};
    }
    case no_process_id: // child process
        // Have to be careful here!
        // From https://man7.org/linux/man-pages/man2/fork.2.html:
        //   "in a multithreaded program, the child can safely call only
        //   async-signal-safe functions (see signal-safety(7)) until such
        //   time as it calls execve(2)."
        pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
        if (!dir.empty() && (::chdir(dir.c_str()) == -1)) {
            fail_child(int(status_out), child_step::chdir);
        }
        ::execve(exe_path.c_str(), argv.data(), envp.data());
        fail_child(int(status_out), child_step::execve);
    default:
        break;
    }
    // spawning/parent process
    auto result = owning_process_id{pid};
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    status_out.close();
    if (const auto failure = read_child_failure(int(status_in))) {
        const auto ec = os_error_code{failure->err};
        (void) result.wait();
        std::ostringstream os;
        if (failure->step == child_step::chdir) {
            os << "chdir to " << exe.working_directory << " failed";
        }
        else {
            os << "execve of " << exe_path << " failed";
        }
        os << ": " << ec;
        throw spawn_error{os.str(), ec};
    }
    return result;
}

auto run_to_completion(const executable& exe, const environment_map& env)
    -> wait_status
{
    auto pid = spawn(exe, env);
    auto status = pid.wait();
    while (!is_terminated(status)) {
        status = pid.wait();
    }
    return status;
}

}
