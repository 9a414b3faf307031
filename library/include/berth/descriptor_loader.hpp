#ifndef descriptor_loader_hpp
#define descriptor_loader_hpp

#include <array>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "berth/environment_map.hpp"
#include "berth/project.hpp"

namespace berth {

/// @brief File names looked for when no descriptor is given, in order.
constexpr auto default_descriptor_names = std::array{
    "compose.yaml",
    "docker-compose.yaml",
    "compose.yml",
    "docker-compose.yml",
};

/// @brief Options for <code>load_project</code>.
/// @see load_project.
struct load_options
{
    /// @brief Project name.
    /// @note Empty to use the descriptor's <code>name</code>, or failing
    ///   that, the name of <code>directory</code>.
    std::string project_name;

    /// @brief Directory relative paths in the descriptor are relative to.
    /// @note Empty for the current working directory.
    std::filesystem::path directory;

    /// @brief Environment that environment entries without values are
    ///   taken from.
    environment_map environment;
};

/// @brief Loads a project from the given YAML descriptor stream.
/// @details Reads the top-level <code>services</code> mapping, and the
///   optional top-level <code>name</code>. Short and long syntaxes of
///   service keys are normalized. Relative paths of environment files,
///   build contexts and bound host paths are made absolute.
/// @param[in] is Stream to read the descriptor from.
/// @param[out] diags Diagnostic information and warnings that don't by
///   themselves prevent loading, like unsupported keys being ignored.
/// @param[in] opts Options.
/// @note This doesn't validate references between services, nor check
///   that referenced files exist.
/// @throws configuration_error if the descriptor can't be parsed, or
///   isn't structured as expected.
/// @see validate.
auto load_project(std::istream& is, std::ostream& diags,
                  const load_options& opts = {}) -> project;

/// @brief Loads a project from the given descriptor file.
/// @note Relative paths are taken relative to the file's directory.
/// @throws configuration_error if the file can't be opened, or as the
///   stream overload does.
auto load_project(const std::filesystem::path& file, std::ostream& diags,
                  load_options opts = {}) -> project;

/// @brief Finds the default descriptor within the given directory.
/// @see default_descriptor_names.
auto find_descriptor(const std::filesystem::path& directory)
    -> std::optional<std::filesystem::path>;

}

#endif /* descriptor_loader_hpp */
