#include <cctype> // for std::isprint
#include <sstream> // for std::ostringstream

#include "berth/charset_checker.hpp"

namespace berth {

charset_validator_error::charset_validator_error(char c,
                                                 std::string chars,
                                                 char_list acc,
                                                 const std::string& what_arg):
    invalid_argument(what_arg),
    chars_(std::move(chars)), access_(acc), badchar_(c)
{
    // Intentionally empty.
}

auto charset_validator_error::access() const noexcept -> char_list
{
    return access_;
}

auto charset_validator_error::charset() const -> std::string
{
    return chars_;
}

auto charset_validator_error::badchar() const noexcept -> char
{
    return badchar_;
}

}

namespace berth::detail {

auto charset_validator(std::string v,
                       char_list access,
                       const std::string& chars)
    -> std::string
{
    const auto found = (access == char_list::deny)
        ? v.find_first_of(chars)
        : v.find_first_not_of(chars);
    if (found == std::string::npos) {
        return v;
    }
    const auto c = v[found];
    std::ostringstream os;
    os << "may not contain '";
    if (std::isprint(static_cast<unsigned char>(c))) {
        os << c;
    }
    else {
        os << "\\" << std::oct << int(static_cast<unsigned char>(c));
    }
    os << "'";
    os << ((access == char_list::deny)
           ? ", character denied"
           : ", character not allowed");
    throw charset_validator_error{c, chars, access, os.str()};
}

}
