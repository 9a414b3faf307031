#ifndef utility_hpp
#define utility_hpp

#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <system_error> // for std::error_code
#include <vector>

#include "berth/env_value.hpp"

namespace berth {

/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_arg_bufs(const std::vector<std::string>& strings,
                   const std::string& fallback = {})
    -> std::vector<std::string>;

/// @brief Makes a vector that's compatible for use with <code>execve</code>'s
///   <code>argv</code> parameter.
/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>;

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&;

/// @brief Finds the given file in the directories of a
///   <code>PATH</code>-styled value.
/// @return Path to the first existing match, if any.
auto find_file(const std::filesystem::path& file, const env_value& path)
    -> std::optional<std::filesystem::path>;

}

#endif /* utility_hpp */
