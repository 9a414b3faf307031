#ifndef env_file_hpp
#define env_file_hpp

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "ext/expected.hpp"

#include "berth/environment_map.hpp"

namespace berth {

/// @brief One <code>NAME=VALUE</code> line of an environment file.
struct env_assignment
{
    env_name name;
    env_value value;
};

/// @brief Parses a single line of an environment file.
/// @details Recognizes the following forms:
///   - blank lines and lines whose first non-blank character is '#',
///     for which an empty optional is returned;
///   - <code>NAME=VALUE</code>, optionally preceded by <code>export</code>;
///   - single quoted values, taken literally;
///   - double quoted values, in which <code>\\n</code>, <code>\\t</code>,
///     <code>\\"</code> and <code>\\\\</code> are unescaped;
///   - unquoted values, whose trailing blanks and <code> #</code> comment
///     are dropped.
/// @return Description of what's wrong with the line on failure.
auto parse_env_line(std::string_view line)
    -> expected<std::optional<env_assignment>, std::string>;

/// @brief Reads an environment file from the given stream.
/// @param[in] is Stream to read from.
/// @param[in] source Name of the source used in error messages.
/// @throws configuration_error if any line can't be parsed.
auto read_env_file(std::istream& is, const std::string& source)
    -> environment_map;

/// @brief Loads the environment file at the given path.
/// @throws configuration_error if the file can't be opened or parsed.
auto load_env_file(const std::filesystem::path& path) -> environment_map;

}

#endif /* env_file_hpp */
