#pragma once

#include <utility>

template <class Func>
class CallInDtor {
    Func func_;
    bool make_call_ = true;

public:
    explicit CallInDtor(Func func) : func_(std::move(func)) {}

    CallInDtor(const CallInDtor&) = delete;
    CallInDtor(CallInDtor&&) = delete;
    CallInDtor& operator=(const CallInDtor&) = delete;
    CallInDtor& operator=(CallInDtor&&) = delete;

    [[nodiscard]] bool active() const noexcept { return make_call_; }

    void cancel() noexcept { make_call_ = false; }

    ~CallInDtor() {
        if (make_call_) {
            func_();
        }
    }
};
