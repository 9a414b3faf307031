#ifndef environment_map_hpp
#define environment_map_hpp

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "berth/env_name.hpp"
#include "berth/env_value.hpp"

namespace berth {

using environment_map = std::map<env_name, env_value>;

auto operator<<(std::ostream& os, const environment_map& value)
    -> std::ostream&;

/// @brief Gets the calling process's environment.
auto get_environ() -> environment_map;

/// @brief Copies every entry of <code>overrides</code> into
///   <code>base</code>, replacing entries of the same name.
auto merge(environment_map& base, const environment_map& overrides) -> void;

/// @brief Finds the value of the named variable, if any.
auto find(const environment_map& env, const env_name& name)
    -> const env_value*;

/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_arg_bufs(const environment_map& envars)
    -> std::vector<std::string>;

}

#endif /* environment_map_hpp */
