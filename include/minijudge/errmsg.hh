#pragma once

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string_view>

// Holds " - <description> (os error <errnum>)" without allocating, so it is
// usable in a forked child as well
class ErrMsg {
    std::array<char, 128> buff_{};
    size_t len_ = 0;

public:
    explicit ErrMsg(int errnum) noexcept {
        auto append = [&](std::string_view str) noexcept {
            size_t n = std::min(str.size(), buff_.size() - 1 - len_);
            std::memcpy(buff_.data() + len_, str.data(), n);
            len_ += n;
        };

        append(" - ");
        std::array<char, 64> descr_buff{};
        // GNU strerror_r() may return a static string instead of filling the buffer
        const char* descr = strerror_r(errnum, descr_buff.data(), descr_buff.size());
        append(descr == nullptr ? "Unknown error" : descr);
        append(" (os error ");
        std::array<char, 16> num_buff{};
        auto [ptr, ec] = std::to_chars(num_buff.data(), num_buff.data() + num_buff.size(), errnum);
        append({num_buff.data(), static_cast<size_t>(ptr - num_buff.data())});
        append(")");
        buff_[len_] = '\0';
    }

    [[nodiscard]] const char* data() const noexcept { return buff_.data(); }

    [[nodiscard]] const char* c_str() const noexcept { return buff_.data(); }

    [[nodiscard]] size_t size() const noexcept { return len_; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return {buff_.data(), len_}; }

    friend std::string_view stringify(const ErrMsg& msg) noexcept { return msg; }
};

inline ErrMsg errmsg(int errnum) noexcept { return ErrMsg{errnum}; }

inline ErrMsg errmsg() noexcept { return ErrMsg{errno}; }

