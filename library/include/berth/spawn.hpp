#ifndef spawn_hpp
#define spawn_hpp

#include <filesystem>
#include <stdexcept> // for std::runtime_error
#include <string>

#include "berth/environment_map.hpp"
#include "berth/executable.hpp"
#include "berth/os_error_code.hpp"
#include "berth/owning_process_id.hpp"
#include "berth/wait_status.hpp"

namespace berth {

/// @brief Failure to start an executable.
struct spawn_error: std::runtime_error
{
    explicit spawn_error(const std::string& what_arg,
                         os_error_code ec = os_error_code{}):
        std::runtime_error(what_arg), code(ec)
    {}

    /// @brief Operating system error behind the failure, if any.
    os_error_code code;
};

/// @brief Gets the path of the file to execute.
/// @details A bare file name is looked up in the directories of the
///   <code>PATH</code> entry of <code>env</code>. Other paths are
///   returned as is.
/// @throws spawn_error if there's no file specified, or no such file
///   in the <code>PATH</code>.
auto resolve_file(const executable& exe, const environment_map& env)
    -> std::filesystem::path;

/// @brief Forks and executes the given executable with the given
///   environment.
/// @details Returns only once the child has successfully called
///   <code>execve</code>. Failure of the child to change directory or to
///   execute is reported back over a close-on-exec pipe and thrown here.
/// @throws spawn_error if the file can't be resolved, the fork fails, or
///   the child fails before executing.
auto spawn(const executable& exe, const environment_map& env)
    -> owning_process_id;

/// @brief Spawns the given executable and waits for it to terminate.
/// @throws spawn_error as <code>spawn</code> does.
auto run_to_completion(const executable& exe, const environment_map& env)
    -> wait_status;

}

#endif /* spawn_hpp */
