#ifndef os_error_code_hpp
#define os_error_code_hpp

#include <ostream>
#include <string>

namespace berth {

/// @brief Operating system error code, like a value of <code>errno</code>.
enum class os_error_code: int;

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_string(os_error_code err) -> std::string;

auto last_os_error_code() noexcept -> os_error_code;

}

#endif /* os_error_code_hpp */
