#ifndef owning_process_id_hpp
#define owning_process_id_hpp

#include <cstdint> // for std::int32_t
#include <type_traits> // for std::is_default_constructible_v

#include "berth/reference_process_id.hpp"
#include "berth/wait_option.hpp"
#include "berth/wait_status.hpp"

namespace berth {

/// @brief Owning process identifier.
/// @note Provides RAII-styled ownership of a child process: the
///   destructor waits for the child to terminate, so no zombie is left
///   behind.
/// @note Implementation of this is based on POSIX process handling.
/// @see https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2019/p1750r1.pdf.
struct owning_process_id
{
    static constexpr auto default_process_id = invalid_process_id;
    static constexpr auto default_status = wait_unknown_status{};

    static auto fork() -> reference_process_id;

    owning_process_id() noexcept = default;
    owning_process_id(reference_process_id id) noexcept;
    owning_process_id(const owning_process_id& other) = delete;
    owning_process_id(owning_process_id&& other) noexcept;
    ~owning_process_id();

    auto operator=(const owning_process_id& other) -> owning_process_id& = delete;
    auto operator=(owning_process_id&& other) noexcept -> owning_process_id&;

    operator reference_process_id() const noexcept;

    explicit operator std::int32_t() const
    {
        return std::int32_t(reference_process_id(*this));
    }

    /// @brief Waits for the owned process to change state.
    /// @note Once the process has terminated, this no longer refers to
    ///   it and just returns the terminating status.
    auto wait(wait_option flags = {}) noexcept -> wait_status;

    auto operator<=>(const owning_process_id& other) const noexcept;

    /// @brief Status of the process.
    /// @note This is an observer function.
    /// @return <code>wait_unknown_status{}</code> if the associated process
    ///   has not yet been seen to change state (possibly because this has
    ///   no associated process).
    [[nodiscard]] auto status() const noexcept -> wait_status;

private:
    auto reap() noexcept -> void;

    reference_process_id pid{default_process_id};
    wait_status last_status{default_status};
};

static_assert(std::is_default_constructible_v<owning_process_id>);
static_assert(std::is_move_constructible_v<owning_process_id>);
static_assert(std::is_move_assignable_v<owning_process_id>);
static_assert(!std::is_copy_constructible_v<owning_process_id>);
static_assert(!std::is_copy_assignable_v<owning_process_id>);

}

#endif /* owning_process_id_hpp */
