#ifndef owning_descriptor_hpp
#define owning_descriptor_hpp

#include <type_traits> // for std::is_default_constructible_v

#include "berth/os_error_code.hpp"

namespace berth {

/// @brief Owning file descriptor.
/// @note Closes the descriptor on destruction.
struct owning_descriptor
{
    static constexpr auto default_descriptor = -1;

    owning_descriptor() noexcept = default;
    explicit owning_descriptor(int d_) noexcept: d{d_} {}
    owning_descriptor(owning_descriptor&& other) noexcept;
    owning_descriptor(const owning_descriptor& other) = delete;
    ~owning_descriptor();

    auto operator=(owning_descriptor&& other) noexcept -> owning_descriptor&;
    auto operator=(const owning_descriptor& other) noexcept = delete;

    explicit operator int() const noexcept { return d; }

    explicit operator bool() const noexcept { return d != default_descriptor; }

    auto close() noexcept -> os_error_code;

private:
    int d{default_descriptor};
};

static_assert(std::is_default_constructible_v<owning_descriptor>);
static_assert(std::is_move_constructible_v<owning_descriptor>);
static_assert(std::is_move_assignable_v<owning_descriptor>);
static_assert(!std::is_copy_constructible_v<owning_descriptor>);
static_assert(!std::is_copy_assignable_v<owning_descriptor>);

}

#endif /* owning_descriptor_hpp */
