#ifndef signal_hpp
#define signal_hpp

#include <ostream>

namespace berth {

enum class signal: int;

auto operator<<(std::ostream& os, signal s) -> std::ostream&;

namespace signals {
auto terminate() noexcept -> signal;
auto kill() noexcept -> signal;
}

}

#endif /* signal_hpp */
