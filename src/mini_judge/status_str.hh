#pragma once

#include <array>
#include <cstdio>
#include <minijudge/judge/execution_outcome.hh>
#include <string>

// Colored, fixed-width (for alignment) status name
inline const char* colored_status(minijudge::judge::ExecutionOutcome::Status status) noexcept {
    using Status = minijudge::judge::ExecutionOutcome::Status;
    switch (status) {
    case Status::Ok: return "\033[1;32mOK\033[m ";
    case Status::CompileError: return "\033[1;31mCE\033[m ";
    case Status::CompileTimeout: return "\033[1;33mCTLE\033[m";
    case Status::RuntimeError: return "\033[1;31mRTE\033[m";
    case Status::ExecutionTimeout: return "\033[1;33mTLE\033[m";
    case Status::UnsupportedLanguage: return "\033[1;35mUL\033[m ";
    case Status::InternalError: return "\033[1;35mIE\033[m ";
    }
    return "??? ";
}

// E.g. "66.67%"
inline std::string percentage_str(double percentage) {
    std::array<char, 32> buff{};
    int len = snprintf(buff.data(), buff.size(), "%.2f%%", percentage);
    return {buff.data(), static_cast<size_t>(len)};
}
