#ifndef service_hpp
#define service_hpp

#include <concepts> // for std::regular.
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "berth/environment_map.hpp"
#include "berth/port_mapping.hpp"
#include "berth/service_name.hpp"
#include "berth/variant.hpp" // for <variant>, berth::variant, + ostream support
#include "berth/volume_binding.hpp"

namespace berth {

/// @brief Prebuilt image a service runs.
struct image_source
{
    /// @brief Image reference, like <code>postgres:12.13-alpine</code>.
    std::string reference;

    auto operator==(const image_source&) const -> bool = default;
};

auto operator<<(std::ostream& os, const image_source& value)
    -> std::ostream&;

/// @brief Build instructions for the image a service runs.
struct build_source
{
    static constexpr auto default_dockerfile = "Dockerfile";

    /// @brief Build context directory.
    /// @note Relative paths are relative to the project directory.
    std::filesystem::path context{"."};

    /// @brief Build file.
    /// @note Relative paths are relative to <code>context</code>.
    std::filesystem::path dockerfile{default_dockerfile};

    auto operator==(const build_source&) const -> bool = default;
};

auto operator<<(std::ostream& os, const build_source& value)
    -> std::ostream&;

/// @brief Gets the context directory resolved against the given project
///   directory.
auto context_path(const build_source& value,
                  const std::filesystem::path& directory)
    -> std::filesystem::path;

/// @brief Gets the build file path resolved against the given project
///   directory.
auto dockerfile_path(const build_source& value,
                     const std::filesystem::path& directory)
    -> std::filesystem::path;

using service_source = variant<image_source, build_source>;

enum class dependency_condition {
    service_started,
    service_healthy,
    service_completed_successfully,
};

auto operator<<(std::ostream& os, dependency_condition value)
    -> std::ostream&;

auto to_dependency_condition(std::string_view string)
    -> std::optional<dependency_condition>;

/// @brief Start-order constraint on another service.
/// @note This isn't a liveness guarantee.
struct dependency
{
    service_name name;
    dependency_condition condition{dependency_condition::service_started};

    auto operator==(const dependency&) const -> bool = default;
};

/// @brief Service declaration.
/// @note This type is intended to be moveable, copyable, and equality
///   comparable.
struct service
{
    /// @brief Identifying name, unique within a project.
    service_name name;

    /// @brief Image to run or instructions to build it.
    service_source source;

    /// @brief Published ports, in declaration order.
    std::vector<port_mapping> ports;

    /// @brief Environment files, in declaration order.
    /// @note Relative paths are relative to the project directory.
    std::vector<std::filesystem::path> env_files;

    /// @brief Inline environment.
    /// @note These override any values from <code>env_files</code>.
    environment_map environment;

    /// @brief Services to start before this one.
    std::vector<dependency> depends_on;

    /// @brief Volume bindings, in declaration order.
    std::vector<volume_binding> volumes;

    /// @brief Arguments overriding the image's default command.
    std::vector<std::string> command;

    auto operator==(const service&) const -> bool = default;
};

static_assert(std::regular<service>);

auto operator<<(std::ostream& os, const service& value) -> std::ostream&;

/// @brief Writes the service in an indented, descriptor-like form.
auto pretty_print(std::ostream& os, const service& value,
                  const std::string& indent = "  ") -> void;

/// @brief Whether the service declares a dependency on the named service.
auto depends_on(const service& value, const service_name& name) -> bool;

}

#endif /* service_hpp */
