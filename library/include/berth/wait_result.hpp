#ifndef wait_result_hpp
#define wait_result_hpp

#include <concepts> // for std::regular.
#include <ostream>

#include "berth/os_error_code.hpp"
#include "berth/reference_process_id.hpp"
#include "berth/variant.hpp" // for <variant>, berth::variant, plus ostream support
#include "berth/wait_option.hpp"
#include "berth/wait_status.hpp"

namespace berth {

/// @brief Result of a non-blocking wait on a child that's still running.
struct empty_wait_result {
    constexpr auto operator<=>(const empty_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const empty_wait_result&)
    -> std::ostream&;

struct nokids_wait_result {
    constexpr auto operator<=>(const nokids_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const nokids_wait_result&)
    -> std::ostream&;

struct error_wait_result {
    os_error_code data;
    constexpr auto operator<=>(const error_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const error_wait_result& arg)
    -> std::ostream&;

struct info_wait_result {
    reference_process_id id{invalid_process_id};
    wait_status status{wait_unknown_status{}};
};

constexpr auto operator==(const info_wait_result& lhs,
                          const info_wait_result& rhs) noexcept
{
    return (lhs.id == rhs.id) && (lhs.status == rhs.status);
}

auto operator<<(std::ostream& os, const info_wait_result& arg)
    -> std::ostream&;

using wait_result = variant<
    empty_wait_result,
    nokids_wait_result,
    error_wait_result,
    info_wait_result
>;

static_assert(std::regular<wait_result>);

/// @brief Waits for a change of state of the identified child process.
/// @note Waits are restarted when interrupted by a signal.
/// @see https://man7.org/linux/man-pages/man2/waitpid.2.html
auto wait(reference_process_id id = invalid_process_id,
          wait_option flags = {}) noexcept
    -> wait_result;

}

#endif /* wait_result_hpp */
