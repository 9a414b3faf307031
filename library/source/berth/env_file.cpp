#include <cctype> // for std::isspace
#include <fstream>
#include <sstream> // for std::ostringstream

#include "berth/configuration_error.hpp"
#include "berth/env_file.hpp"

namespace berth {

namespace {

constexpr auto comment_token = '#';
constexpr auto assignment_token = '=';
constexpr auto export_keyword = std::string_view{"export"};

auto is_blank(char c) noexcept -> bool
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto trim_front(std::string_view s) noexcept -> std::string_view
{
    while (!s.empty() && is_blank(s.front())) {
        s.remove_prefix(1u);
    }
    return s;
}

auto trim_back(std::string_view s) noexcept -> std::string_view
{
    while (!s.empty() && is_blank(s.back())) {
        s.remove_suffix(1u);
    }
    return s;
}

auto trim(std::string_view s) noexcept -> std::string_view
{
    return trim_back(trim_front(s));
}

auto unquote_single(std::string_view s)
    -> expected<std::string, std::string>
{
    const auto close = s.find('\'', 1u);
    if (close == std::string_view::npos) {
        return unexpected<std::string>{"missing closing single quote"};
    }
    const auto rest = trim(s.substr(close + 1u));
    if (!rest.empty() && rest.front() != comment_token) {
        return unexpected<std::string>{"unexpected text after closing quote"};
    }
    return std::string{s.substr(1u, close - 1u)};
}

auto unquote_double(std::string_view s)
    -> expected<std::string, std::string>
{
    auto result = std::string{};
    auto i = std::size_t{1u};
    for (; i < s.size(); ++i) {
        const auto c = s[i];
        if (c == '"') {
            break;
        }
        if (c != '\\' || (i + 1u) == s.size()) {
            result += c;
            continue;
        }
        switch (const auto e = s[++i]; e) {
        case 'n': result += '\n'; break;
        case 't': result += '\t'; break;
        case 'r': result += '\r'; break;
        case '"':
        case '\\':
        case '$':
            result += e;
            break;
        default:
            result += '\\';
            result += e;
            break;
        }
    }
    if (i >= s.size()) {
        return unexpected<std::string>{"missing closing double quote"};
    }
    const auto rest = trim(s.substr(i + 1u));
    if (!rest.empty() && rest.front() != comment_token) {
        return unexpected<std::string>{"unexpected text after closing quote"};
    }
    return result;
}

auto unquoted(std::string_view s) -> std::string
{
    for (auto i = std::size_t{}; i < s.size(); ++i) {
        if (s[i] == comment_token && (i == 0u || is_blank(s[i - 1u]))) {
            s = s.substr(0u, i);
            break;
        }
    }
    return std::string{trim_back(s)};
}

}

auto parse_env_line(std::string_view line)
    -> expected<std::optional<env_assignment>, std::string>
{
    line = trim_front(line);
    if (line.empty() || line.front() == comment_token) {
        return std::optional<env_assignment>{};
    }
    if (line.starts_with(export_keyword) &&
        (line.size() > size(export_keyword)) &&
        is_blank(line[size(export_keyword)])) {
        line = trim_front(line.substr(size(export_keyword)));
    }
    const auto found = line.find(assignment_token);
    if (found == std::string_view::npos) {
        return unexpected<std::string>{"expected '='"};
    }
    const auto name = trim_back(line.substr(0u, found));
    if (name.empty()) {
        return unexpected<std::string>{"empty variable name"};
    }
    for (auto&& c: name) {
        if (is_blank(c)) {
            return unexpected<std::string>{"variable name contains blank"};
        }
    }
    const auto raw = trim_front(line.substr(found + 1u));
    auto value = expected<std::string, std::string>{};
    if (!raw.empty() && raw.front() == '\'') {
        value = unquote_single(raw);
    }
    else if (!raw.empty() && raw.front() == '"') {
        value = unquote_double(raw);
    }
    else {
        value = unquoted(raw);
    }
    if (!value) {
        return unexpected<std::string>{value.error()};
    }
    try {
        return env_assignment{env_name{name}, env_value{*value}};
    }
    catch (const charset_validator_error& ex) {
        return unexpected<std::string>{ex.what()};
    }
}

auto read_env_file(std::istream& is, const std::string& source)
    -> environment_map
{
    auto result = environment_map{};
    auto line = std::string{};
    auto number = 0u;
    while (std::getline(is, line)) {
        ++number;
        const auto parsed = parse_env_line(line);
        if (!parsed) {
            std::ostringstream os;
            os << source << ":" << number << ": " << parsed.error();
            throw configuration_error{os.str()};
        }
        if (*parsed) {
            result.insert_or_assign((*parsed)->name, (*parsed)->value);
        }
    }
    return result;
}

auto load_env_file(const std::filesystem::path& path) -> environment_map
{
    std::ifstream is{path};
    if (!is.is_open()) {
        std::ostringstream os;
        os << "cannot open environment file " << path;
        throw configuration_error{os.str()};
    }
    return read_env_file(is, path.string());
}

}
