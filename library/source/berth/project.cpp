#include <cctype> // for std::isalnum, std::tolower

#include "berth/project.hpp"

namespace berth {

auto find(const project& value, const service_name& name) -> const service*
{
    for (auto&& entry: value.services) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

auto find_index(const project& value, const service_name& name)
    -> std::optional<std::size_t>
{
    const auto max_index = size(value.services);
    for (auto index = std::size_t{}; index < max_index; ++index) {
        if (value.services[index].name == name) {
            return index;
        }
    }
    return {};
}

auto operator<<(std::ostream& os, const project& value) -> std::ostream&
{
    os << "project{";
    os << ".name=" << value.name;
    os << ",.directory=" << value.directory;
    os << ",.services={";
    auto prefix = "";
    for (auto&& entry: value.services) {
        os << prefix << entry;
        prefix = ",";
    }
    os << "}}";
    return os;
}

auto pretty_print(std::ostream& os, const project& value) -> void
{
    os << "name: " << value.name << "\n";
    os << "services:\n";
    for (auto&& entry: value.services) {
        pretty_print(os, entry);
    }
}

auto to_project_name(std::string_view string) -> std::string
{
    auto result = std::string{};
    for (auto&& c: string) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            result += static_cast<char>(std::tolower(uc));
        }
        else if ((c == '_') || (c == '-')) {
            result += c;
        }
    }
    return result;
}

}
