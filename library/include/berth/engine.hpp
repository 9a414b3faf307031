#ifndef engine_hpp
#define engine_hpp

#include <filesystem>
#include <string>

#include "berth/environment_map.hpp"
#include "berth/executable.hpp"
#include "berth/project.hpp"

namespace berth {

/// @brief Container engine options.
struct engine_options
{
    static constexpr auto default_program = "docker";

    /// @brief Engine command line program.
    /// @note Any program taking the same sub-commands as
    ///   <code>docker</code> works, like <code>podman</code>.
    std::filesystem::path program{default_program};
};

/// @brief Gets the name of the container run for the service.
/// @return Name like <code>P-S-1</code> for project <code>P</code> and
///   service <code>S</code>.
auto container_name(const project& p, const service& s) -> std::string;

/// @brief Gets the name of the image built for the service.
/// @return Name like <code>P-S</code>, lower cased.
auto image_name(const project& p, const service& s) -> std::string;

/// @brief Gets the name of the network the project's services join.
/// @return Name like <code>P_default</code>.
auto network_name(const project& p) -> std::string;

/// @brief Gets the environment the service's container is given.
/// @details Reads the service's environment files in order, each
///   overriding entries of the ones before, then applies the service's
///   inline environment on top.
/// @throws configuration_error if an environment file can't be read.
auto service_environment(const project& p, const service& s)
    -> environment_map;

/// @brief Makes the command creating the project's network.
auto make_network_create(const project& p, const engine_options& opts)
    -> executable;

/// @brief Makes the command building the service's image.
/// @throws std::invalid_argument if the service isn't built from source.
auto make_build_command(const project& p, const service& s,
                        const engine_options& opts) -> executable;

/// @brief Makes the command starting the service's container detached.
/// @param[in] env Environment to give the container.
/// @see service_environment.
auto make_run_command(const project& p, const service& s,
                      const environment_map& env,
                      const engine_options& opts) -> executable;

/// @brief Makes the command forcibly removing the named container.
auto make_remove_command(const std::string& container,
                         const engine_options& opts) -> executable;

/// @brief Makes the command removing the named network.
auto make_network_remove(const std::string& network,
                         const engine_options& opts) -> executable;

}

#endif /* engine_hpp */
