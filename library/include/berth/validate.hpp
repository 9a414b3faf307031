#ifndef validate_hpp
#define validate_hpp

#include <ostream>

#include "berth/project.hpp"

namespace berth {

/// @brief Checks that every dependency names a declared service and that
///   dependencies don't form a cycle.
/// @throws configuration_error if the check fails.
auto check_dependencies(const project& value) -> void;

/// @brief Checks that no two published ports claim the same host port.
/// @throws configuration_error naming the later declared service of the
///   first conflicting pair found.
auto check_ports(const project& value) -> void;

/// @brief Checks that files referenced by the project exist.
/// @details That's every environment file, and for services built from
///   source, the build context directory and its build file.
/// @throws configuration_error if a file is missing.
auto check_files(const project& value) -> void;

/// @brief Validates the project as a whole.
/// @details Runs every check above and also checks every image reference
///   is non-empty. Host paths bound into more than one service are only
///   warned about on <code>diags</code>.
/// @throws configuration_error for the first problem found.
auto validate(const project& value, std::ostream& diags) -> void;

}

#endif /* validate_hpp */
