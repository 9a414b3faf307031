#ifndef configuration_error_hpp
#define configuration_error_hpp

#include <stdexcept> // for std::invalid_argument
#include <string>

#include "berth/service_name.hpp"

namespace berth {

/// @brief Error in a project's declaration.
/// @note Thrown before any service is started.
struct configuration_error: std::invalid_argument
{
    explicit configuration_error(const std::string& what_arg,
                                 service_name s = {}):
        std::invalid_argument(what_arg), service(std::move(s))
    {}

    /// @brief Name of the service the error is about.
    /// @note Empty if the error isn't about a particular service.
    service_name service;
};

}

#endif /* configuration_error_hpp */
