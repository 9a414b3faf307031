#ifndef project_hpp
#define project_hpp

#include <cstddef> // for std::size_t
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "berth/service.hpp"

namespace berth {

/// @brief Set of services declared together.
/// @note Services are kept in declaration order, which is the order
///   ties in starting order are broken by.
struct project
{
    /// @brief Name prefixing everything made for the project.
    std::string name;

    /// @brief Directory relative paths are relative to.
    std::filesystem::path directory;

    /// @brief Services in declaration order.
    std::vector<service> services;

    auto operator==(const project&) const -> bool = default;
};

auto find(const project& value, const service_name& name) -> const service*;

auto find_index(const project& value, const service_name& name)
    -> std::optional<std::size_t>;

auto operator<<(std::ostream& os, const project& value) -> std::ostream&;

/// @brief Writes the project in a descriptor-like form.
auto pretty_print(std::ostream& os, const project& value) -> void;

/// @brief Makes a project name from the given string.
/// @details Lower cases letters and drops every character other than
///   letters, digits, '_', and '-'.
auto to_project_name(std::string_view string) -> std::string;

}

#endif /* project_hpp */
