#include "berth/utility.hpp"

namespace berth {

auto make_arg_bufs(const std::vector<std::string>& strings,
                   const std::string& fallback)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    if (strings.empty()) {
        if (!fallback.empty()) {
            result.push_back(fallback);
        }
    }
    else {
        for (auto&& string: strings) {
            result.push_back(string);
        }
    }
    return result;
}

auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>
{
    auto result = std::vector<char*>{};
    for (auto&& arg: args) {
        result.push_back(arg.data());
    }
    result.push_back(nullptr); // last element must always be nullptr!
    return result;
}

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&
{
    os << ec << " (" << ec.message() << ")";
    return os;
}

auto find_file(const std::filesystem::path& file, const env_value& path)
    -> std::optional<std::filesystem::path>
{
    static constexpr auto delimiter = ':';
    auto ec = std::error_code{};
    const auto& dirs = path.get();
    auto last = std::size_t{};
    for (;;) {
        const auto next = dirs.find(delimiter, last);
        const auto dir = dirs.substr(last, next - last);
        if (!dir.empty()) {
            const auto full_path = std::filesystem::path{dir} / file;
            if (exists(full_path, ec) && !ec) {
                return full_path;
            }
        }
        if (next == std::string::npos) {
            break;
        }
        last = next + 1u;
    }
    return {};
}

}
