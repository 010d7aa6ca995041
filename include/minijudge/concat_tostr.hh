#pragma once

#include <string>
#include <string_view>
#include <type_traits>

// Types other than the below provide stringify() as a hidden friend, found by ADL
namespace concat_detail {

inline std::string_view stringify(const char* str) noexcept { return str; }

inline std::string_view stringify(const std::string& str) noexcept { return str; }

inline std::string_view stringify(std::string_view str) noexcept { return str; }

inline std::string stringify(char c) { return std::string(1, c); }

std::string stringify(bool) = delete; // Ambiguous: "1" or "true"?

template <
    class T,
    std::enable_if_t<
        std::is_integral_v<T> and !std::is_same_v<T, char> and !std::is_same_v<T, bool>,
        int> = 0>
std::string stringify(T x) {
    return std::to_string(x);
}

template <class T>
constexpr inline bool is_stringifiable = requires(const std::remove_reference_t<T>& x) {
    stringify(x);
};

template <class T>
decltype(auto) to_piece(const T& x) {
    return stringify(x);
}

} // namespace concat_detail

template <class T>
constexpr inline bool is_string_argument = concat_detail::is_stringifiable<T>;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (size_t{0} + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += str);
        return res;
    }(concat_detail::to_piece(args)...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve((str.size() + ... + std::string_view{xx}.size()));
        return (str += ... += xx);
    }(concat_detail::to_piece(args)...);
}
