#pragma once

#include <atomic>
#include <cstdio>
#include <minijudge/concat_tostr.hh>
#include <minijudge/file_path.hh>
#include <string>
#include <utility>

class Logger {
    FILE* f_;
    bool opened_ = false;
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (opened_) {
            opened_ = false;
            (void)fclose(f_);
        }
    }

    // Lock the file
    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }

        flockfile(f_);
        return true;
    }

    // Unlock the file
    void unlock() noexcept { funlockfile(f_); }

public:
    // Like open()
    explicit Logger(FilePath filename);

    // Like use(), it accepts nullptr for which a dummy logger is created
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Opens file @p filename in append mode as log file, if fopen()
     *   error occurs exception is thrown and the inner stream is unchanged
     *
     * @errors Throws an exception std::runtime_error if an fopen() error
     *   occurs
     */
    void open(FilePath filename);

    // Sets @p stream as log stream, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    // Returns the previous value
    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool orig_label_;
        // Differs from orig_label_ after flush_no_nl(), to avoid adding label in
        // the middle of the line
        bool label_;
        std::string buff_;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit Appender(Logger& logger, Args&&... args)
        : logger_(logger)
        , orig_label_(logger.label())
        , label_(orig_label_) {
            operator()(std::forward<Args>(args)...);
        }

        void flush_impl(bool newline) noexcept;

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(app.flushed_)
        , orig_label_(app.orig_label_)
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {
            app.flushed_ = true;
        }

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept {
            flush_impl(true);
            label_ = orig_label_;
        }

        // Like flush() but does not append the '\n' to the log
        void flush_no_nl() noexcept {
            flush_impl(false);
            label_ = false;
        }

        ~Appender() { flush(); }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() { close(); }
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
