#include <string_view>

#include "berth/executable.hpp"

namespace berth {

namespace {

constexpr auto shell_safe_chars = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "_-.,:/=@%+"
};

auto write_shell_word(std::ostream& os, const std::string& word) -> void
{
    if (!word.empty() &&
        (word.find_first_not_of(shell_safe_chars) == std::string::npos)) {
        os << word;
        return;
    }
    os << '\'';
    for (auto&& c: word) {
        if (c == '\'') {
            os << "'\\''";
            continue;
        }
        os << c;
    }
    os << '\'';
}

}

auto operator<<(std::ostream& os, const executable& value)
    -> std::ostream&
{
    os << "executable{";
    os << ".file=" << value.file;
    os << ",.arguments={";
    auto prefix = "";
    for (auto&& arg: value.arguments) {
        os << prefix << arg;
        prefix = ",";
    }
    os << "}";
    os << ",.working_directory=" << value.working_directory;
    os << "}";
    return os;
}

auto write_command_line(std::ostream& os, const executable& value)
    -> std::ostream&
{
    if (value.arguments.empty()) {
        write_shell_word(os, value.file.string());
        return os;
    }
    auto prefix = "";
    for (auto&& arg: value.arguments) {
        os << prefix;
        write_shell_word(os, arg);
        prefix = " ";
    }
    return os;
}

}
