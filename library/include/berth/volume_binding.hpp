#ifndef volume_binding_hpp
#define volume_binding_hpp

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "ext/expected.hpp"

namespace berth {

/// @brief Volume binding of a service.
struct volume_binding
{
    /// @brief Host path or volume name.
    std::string source;

    /// @brief Path within the container.
    std::string target;

    /// @brief Mount options like <code>ro</code>, <code>rw</code>,
    ///   <code>z</code>, or <code>Z</code>.
    /// @note Empty means the engine's default.
    std::string mode;
};

inline auto operator==(const volume_binding& lhs,
                       const volume_binding& rhs) noexcept -> bool
{
    return (lhs.source == rhs.source)
        && (lhs.target == rhs.target)
        && (lhs.mode == rhs.mode);
}

/// @brief Writes the binding in the short <code>SRC:DST[:MODE]</code>
///   syntax.
auto operator<<(std::ostream& os, const volume_binding& value)
    -> std::ostream&;

/// @brief Whether the source names a host path rather than a volume.
/// @note Only sources starting with '.' or '/' are host paths.
auto is_host_path(const volume_binding& value) -> bool;

/// @brief Parses the short syntax of a volume binding.
auto parse_volume_binding(std::string_view string)
    -> expected<volume_binding, std::string>;

/// @brief Gets the binding with a relative host path source made
///   absolute against <code>directory</code>.
auto resolve(volume_binding value, const std::filesystem::path& directory)
    -> volume_binding;

}

#endif /* volume_binding_hpp */
