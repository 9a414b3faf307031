#ifndef bring_up_hpp
#define bring_up_hpp

#include <ostream>
#include <stdexcept> // for std::runtime_error
#include <string>

#include "berth/deployment.hpp"
#include "berth/engine.hpp"
#include "berth/environment_map.hpp"
#include "berth/project.hpp"

namespace berth {

/// @brief When a started service counts as ready for its dependents.
/// @note Neither is a liveness probe of what runs in the container.
enum class readiness {
    /// @brief Once the engine's run command has been executed.
    started,
    /// @brief Once the engine's run command has exited with status 0.
    completed,
};

auto operator<<(std::ostream& os, readiness value) -> std::ostream&;

/// @brief Options for <code>bring_up</code> and <code>tear_down</code>.
struct bring_up_options
{
    engine_options engine;

    readiness ready{readiness::started};

    /// @brief Environment engine processes are run with.
    /// @note This is also where a bare engine program name is looked up
    ///   in the <code>PATH</code> of.
    environment_map environment{get_environ()};

    /// @brief Stream to write commands to instead of running them.
    /// @note Null to run commands.
    std::ostream* dry_run{};
};

/// @brief Failure to start a service.
struct start_error: std::runtime_error
{
    explicit start_error(const std::string& what_arg, service_name s = {}):
        std::runtime_error(what_arg), service(std::move(s))
    {}

    /// @brief Name of the service that couldn't be started.
    /// @note Empty if the failure isn't about a particular service.
    service_name service;
};

/// @brief Brings up the project's services.
/// @details Validates the project, creates the project network, then
///   starts the services wave by wave. Images of services built from
///   source are built before the run commands of their wave are issued.
///   A service's run command is only issued once those of all of its
///   dependencies have been, and under <code>readiness::completed</code>
///   once those have exited with status 0.
/// @param[in] p Project to bring up.
/// @param[in,out] result Deployment every started service is recorded
///   in, even if a later one fails to start.
/// @param[out] diags Diagnostic information.
/// @param[in] opts Options.
/// @throws configuration_error if the project isn't valid. Nothing is
///   started then.
/// @throws start_error if an engine command can't be run or fails.
/// @see start_waves, validate.
auto bring_up(const project& p, deployment& result, std::ostream& diags,
              const bring_up_options& opts = {}) -> void;

/// @brief Brings up the project's services.
/// @note On failure, services already started are left running.
/// @see bring_up.
auto bring_up(const project& p, std::ostream& diags,
              const bring_up_options& opts = {}) -> deployment;

/// @brief Removes what was brought up.
/// @details Waits for outstanding run commands, removes the started
///   containers in reverse start order, then removes the network.
///   Failures are written to <code>diags</code> and don't stop the
///   remaining removals.
auto tear_down(deployment& value, std::ostream& diags,
               const bring_up_options& opts = {}) -> void;

/// @brief Removes the containers and network a bring-up of the project
///   would make.
/// @details Same as tearing down a deployment having started every
///   service of the project in <code>start_sequence</code>.
auto tear_down(const project& p, std::ostream& diags,
               const bring_up_options& opts = {}) -> void;

}

#endif /* bring_up_hpp */
