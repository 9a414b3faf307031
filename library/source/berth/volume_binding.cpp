#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream

#include "berth/volume_binding.hpp"

namespace berth {

namespace {

constexpr auto field_separator = ':';

auto invalid(std::string_view what, std::string_view string)
    -> unexpected<std::string>
{
    std::ostringstream os;
    os << what << " in volume " << std::quoted(string);
    return unexpected<std::string>{os.str()};
}

}

auto operator<<(std::ostream& os, const volume_binding& value)
    -> std::ostream&
{
    os << value.source << field_separator << value.target;
    if (!value.mode.empty()) {
        os << field_separator << value.mode;
    }
    return os;
}

auto is_host_path(const volume_binding& value) -> bool
{
    return value.source.starts_with('.')
        || value.source.starts_with('/');
}

auto parse_volume_binding(std::string_view string)
    -> expected<volume_binding, std::string>
{
    auto result = volume_binding{};
    const auto first = string.find(field_separator);
    if (first == std::string_view::npos) {
        return invalid("missing container path", string);
    }
    result.source = std::string{string.substr(0u, first)};
    auto rest = string.substr(first + 1u);
    if (const auto found = rest.find(field_separator);
        found != std::string_view::npos) {
        result.mode = std::string{rest.substr(found + 1u)};
        rest = rest.substr(0u, found);
        if (result.mode.empty()) {
            return invalid("empty mode", string);
        }
    }
    result.target = std::string{rest};
    if (result.source.empty()) {
        return invalid("empty source", string);
    }
    if (!result.target.starts_with('/')) {
        return invalid("container path not absolute", string);
    }
    return result;
}

auto resolve(volume_binding value, const std::filesystem::path& directory)
    -> volume_binding
{
    if (!value.source.starts_with('.')) {
        return value;
    }
    value.source = (directory / value.source).lexically_normal().string();
    if ((size(value.source) > 1u) && value.source.ends_with('/')) {
        value.source.pop_back();
    }
    return value;
}

}
