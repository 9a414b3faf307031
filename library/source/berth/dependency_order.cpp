#include <algorithm> // for std::max
#include <iomanip> // for std::quoted
#include <set>
#include <sstream> // for std::ostringstream

#include "berth/configuration_error.hpp"
#include "berth/dependency_order.hpp"

namespace berth {

namespace {

enum class mark { unvisited, visiting, done };

/// @brief Indices of the declared services each service depends on.
/// @note Repeated and undeclared dependencies are dropped.
auto dependency_indices(const project& value)
    -> std::vector<std::set<std::size_t>>
{
    auto result = std::vector<std::set<std::size_t>>(size(value.services));
    for (auto i = std::size_t{}; i < size(value.services); ++i) {
        for (auto&& dep: value.services[i].depends_on) {
            if (const auto found = find_index(value, dep.name)) {
                result[i].insert(*found);
            }
        }
    }
    return result;
}

auto visit(std::size_t index,
           const std::vector<std::set<std::size_t>>& deps,
           std::vector<mark>& marks,
           std::vector<std::size_t>& path) -> bool
{
    marks[index] = mark::visiting;
    path.push_back(index);
    for (auto&& dep: deps[index]) {
        if (marks[dep] == mark::visiting) {
            path.push_back(dep);
            return true;
        }
        if ((marks[dep] == mark::unvisited) && visit(dep, deps, marks, path)) {
            return true;
        }
    }
    path.pop_back();
    marks[index] = mark::done;
    return false;
}

auto check_declared(const project& value) -> void
{
    for (auto&& entry: value.services) {
        for (auto&& dep: entry.depends_on) {
            if (!find(value, dep.name)) {
                std::ostringstream os;
                os << "service " << std::quoted(entry.name.get());
                os << " depends on undeclared service ";
                os << std::quoted(dep.name.get());
                throw configuration_error{os.str(), entry.name};
            }
        }
    }
}

[[noreturn]]
auto throw_cycle(const std::vector<service_name>& cycle) -> void
{
    std::ostringstream os;
    os << "dependency cycle: ";
    write(os, cycle, " -> ");
    throw configuration_error{os.str(), cycle.front()};
}

auto order_indices(const project& value) -> std::vector<std::size_t>
{
    check_declared(value);
    const auto deps = dependency_indices(value);
    const auto count = size(value.services);
    auto pending = std::vector<std::size_t>(count);
    auto dependents = std::vector<std::vector<std::size_t>>(count);
    for (auto i = std::size_t{}; i < count; ++i) {
        pending[i] = size(deps[i]);
        for (auto&& dep: deps[i]) {
            dependents[dep].push_back(i);
        }
    }
    auto ready = std::set<std::size_t>{};
    for (auto i = std::size_t{}; i < count; ++i) {
        if (pending[i] == 0u) {
            ready.insert(i);
        }
    }
    auto result = std::vector<std::size_t>{};
    result.reserve(count);
    while (!ready.empty()) {
        const auto next = *ready.begin();
        ready.erase(ready.begin());
        result.push_back(next);
        for (auto&& dependent: dependents[next]) {
            if (--pending[dependent] == 0u) {
                ready.insert(dependent);
            }
        }
    }
    if (size(result) != count) {
        throw_cycle(find_cycle(value));
    }
    return result;
}

}

auto find_cycle(const project& value) -> std::vector<service_name>
{
    const auto deps = dependency_indices(value);
    auto marks = std::vector<mark>(size(value.services), mark::unvisited);
    auto path = std::vector<std::size_t>{};
    for (auto i = std::size_t{}; i < size(value.services); ++i) {
        if ((marks[i] == mark::unvisited) && visit(i, deps, marks, path)) {
            // path ends with the repeated index; drop what led up to it
            const auto first = std::find(begin(path), end(path), path.back());
            auto result = std::vector<service_name>{};
            for (auto it = first; it != end(path); ++it) {
                result.push_back(value.services[*it].name);
            }
            return result;
        }
    }
    return {};
}

auto start_order(const project& value) -> std::vector<service_name>
{
    auto result = std::vector<service_name>{};
    for (auto&& index: order_indices(value)) {
        result.push_back(value.services[index].name);
    }
    return result;
}

auto start_waves(const project& value)
    -> std::vector<std::vector<service_name>>
{
    const auto order = order_indices(value);
    const auto deps = dependency_indices(value);
    auto wave_of = std::vector<std::size_t>(size(value.services));
    auto result = std::vector<std::vector<service_name>>{};
    for (auto&& index: order) {
        auto wave = std::size_t{};
        for (auto&& dep: deps[index]) {
            wave = std::max(wave, wave_of[dep] + 1u);
        }
        wave_of[index] = wave;
        if (wave >= size(result)) {
            result.resize(wave + 1u);
        }
        result[wave].push_back(value.services[index].name);
    }
    return result;
}

auto start_sequence(const project& value) -> std::vector<service_name>
{
    auto result = std::vector<service_name>{};
    for (auto&& wave: start_waves(value)) {
        result.insert(end(result), begin(wave), end(wave));
    }
    return result;
}

}
