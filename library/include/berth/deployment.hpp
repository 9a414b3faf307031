#ifndef deployment_hpp
#define deployment_hpp

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "berth/executable.hpp"
#include "berth/owning_process_id.hpp"
#include "berth/service_name.hpp"
#include "berth/signal.hpp"
#include "berth/variant.hpp" // for <variant>, berth::variant, + ostream support
#include "berth/wait_status.hpp"

namespace berth {

/// @brief Record of the engine run command issued for a service.
struct service_instance
{
    /// @brief Name of the container the command runs.
    std::string container;

    /// @brief Run command that was issued.
    executable command;

    /// @brief Run command process while it's running, its final status
    ///   after.
    /// @note For dry runs, this is <code>wait_unknown_status</code>.
    variant<owning_process_id, wait_status> state{wait_unknown_status{}};
};

auto operator<<(std::ostream& os, const service_instance& value)
    -> std::ostream&;

/// @brief Record of a project's bring-up.
/// @note This is move-only since it owns the processes it started.
struct deployment
{
    std::string project_name;

    /// @brief Name of the network created for the project.
    /// @note Empty if none has been.
    std::string network;

    /// @brief Services whose run commands were issued, in start order.
    std::vector<service_name> started;

    std::map<service_name, service_instance> services;
};

/// @brief Reaps any run command processes that have terminated.
/// @note This doesn't block.
auto update(deployment& value) -> void;

/// @brief Waits for every run command process to terminate.
auto wait(deployment& value) -> void;

/// @brief Sends the given signal to every run command process that's
///   still running.
auto send_signal(signal sig, const deployment& value, std::ostream& diags)
    -> void;

/// @brief Writes a table of the started services and their states.
auto pretty_print(std::ostream& os, const deployment& value) -> void;

}

#endif /* deployment_hpp */
