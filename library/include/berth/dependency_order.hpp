#ifndef dependency_order_hpp
#define dependency_order_hpp

#include <vector>

#include "berth/project.hpp"

namespace berth {

/// @brief Finds a dependency cycle among the project's services.
/// @note Dependencies on undeclared services are ignored.
/// @return Names along the cycle with the first name repeated at the
///   end, like <code>{a, b, a}</code>, or empty if there's no cycle.
auto find_cycle(const project& value) -> std::vector<service_name>;

/// @brief Gets the order to start the project's services in.
/// @details Every service comes after all of its dependencies. Among the
///   services whose dependencies are all ordered, the one declared first
///   is ordered next.
/// @throws configuration_error if a dependency isn't declared, or if
///   dependencies form a cycle.
auto start_order(const project& value) -> std::vector<service_name>;

/// @brief Gets the services grouped into waves that may start together.
/// @details A service without dependencies is in the first wave. Any
///   other service is in the wave after the latest wave of its
///   dependencies. Within a wave, services are in start order.
/// @throws configuration_error as <code>start_order</code> does.
/// @see start_order.
auto start_waves(const project& value)
    -> std::vector<std::vector<service_name>>;

/// @brief Gets the order run commands are issued in by a bring-up.
/// @details That's every wave's services, wave after wave. This can
///   differ from <code>start_order</code> when a later declared service
///   is in an earlier wave.
/// @throws configuration_error as <code>start_order</code> does.
/// @see start_waves.
auto start_sequence(const project& value) -> std::vector<service_name>;

}

#endif /* dependency_order_hpp */
