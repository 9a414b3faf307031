#ifndef executable_hpp
#define executable_hpp

#include <concepts> // for std::regular.
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace berth {

/// @brief Executable file along with how to run it.
struct executable
{
    /// @brief Path to the executable file.
    /// @note A bare file name is looked up in the <code>PATH</code>.
    std::filesystem::path file;

    /// @brief Arguments to pass to the executable.
    /// @note The first argument is the program name. If there are no
    ///   arguments, <code>file</code> is used as the program name.
    std::vector<std::string> arguments;

    /// @brief Working directory.
    /// @note Empty means the working directory of the caller.
    std::filesystem::path working_directory;
};

inline auto operator==(const executable& lhs,
                       const executable& rhs) noexcept -> bool
{
    return (lhs.file == rhs.file)
        && (lhs.arguments == rhs.arguments)
        && (lhs.working_directory == rhs.working_directory);
}

static_assert(std::regular<executable>);

auto operator<<(std::ostream& os, const executable& value) -> std::ostream&;

/// @brief Writes the executable as a shell command line.
/// @note Arguments containing characters special to the shell are single
///   quoted.
auto write_command_line(std::ostream& os, const executable& value)
    -> std::ostream&;

}

#endif /* executable_hpp */
