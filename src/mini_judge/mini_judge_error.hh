#pragma once

#include <minijudge/concat_tostr.hh>
#include <stdexcept>

// Error caused by the user of the driver (bad arguments, missing files)
class MiniJudgeError : protected std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit MiniJudgeError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}

    MiniJudgeError(const MiniJudgeError&) = default;
    MiniJudgeError(MiniJudgeError&&) = default;
    MiniJudgeError& operator=(const MiniJudgeError&) = default;
    MiniJudgeError& operator=(MiniJudgeError&&) = default;

    using std::runtime_error::what;

    ~MiniJudgeError() override = default;
};
