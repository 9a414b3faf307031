#include <cstring> // for std::strchr

#include "berth/environment_map.hpp"

extern char **environ; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

namespace berth {

namespace {

constexpr auto env_separator = '=';

}

auto operator<<(std::ostream& os, const environment_map& value)
    -> std::ostream&
{
    os << "{";
    auto prefix = "";
    for (auto&& entry: value) {
        os << prefix << entry.first << env_separator << entry.second;
        prefix = ",";
    }
    os << "}";
    return os;
}

auto get_environ() -> environment_map
{
    environment_map result;
    for (auto env = ::environ; env && *env; ++env) {
        const auto found = std::strchr(*env, env_separator);
        const auto name = found? env_name{*env, found}: env_name{*env};
        const auto value = found? env_value{found + 1}: env_value{};
        result[name] = value;
    }
    return result;
}

auto merge(environment_map& base, const environment_map& overrides) -> void
{
    for (auto&& entry: overrides) {
        base.insert_or_assign(entry.first, entry.second);
    }
}

auto find(const environment_map& env, const env_name& name)
    -> const env_value*
{
    const auto it = env.find(name);
    return (it != env.end())? &(it->second): nullptr;
}

auto make_arg_bufs(const environment_map& envars)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    for (const auto& entry: envars) {
        auto string = std::string(entry.first);
        string += env_separator;
        string += std::string(entry.second);
        result.push_back(std::move(string));
    }
    return result;
}

}
