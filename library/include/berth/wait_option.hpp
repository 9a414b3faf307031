#ifndef wait_option_hpp
#define wait_option_hpp

namespace berth {

enum class wait_option: int;

namespace wait_options {
auto nohang() noexcept -> wait_option;
}

}

#endif /* wait_option_hpp */
