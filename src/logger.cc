#include <minijudge/errmsg.hh>
#include <minijudge/logger.hh>
#include <minijudge/macros/throw.hh>
#include <minijudge/time.hh>

using std::string;

namespace {

FILE* open_log_file(FilePath filename) {
    FILE* f = fopen(filename, "ae"); // append, close-on-exec
    if (f == nullptr) {
        THROW("cannot open log file `", filename, '`', errmsg());
    }
    return f;
}

// "[ 2024-01-31 12:00:00 ] " or a placeholder if the local time is unavailable
string record_label() noexcept {
    try {
        return concat_tostr("[ ", localdate_str(), " ] ");
    } catch (const std::exception&) {
        return "[ unknown time ] ";
    }
}

} // namespace

Logger::Logger(FilePath filename) : f_(open_log_file(filename)), opened_(true) {}

void Logger::open(FilePath filename) {
    FILE* f = open_log_file(filename);
    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush_impl(bool newline) noexcept {
    if (flushed_) {
        return;
    }
    flushed_ = true;

    if (newline) {
        buff_ += '\n';
    }
    if (logger_.lock()) {
        if (label_) {
            string label = record_label();
            (void)fwrite(label.data(), 1, label.size(), logger_.f_);
        }
        (void)fwrite(buff_.data(), 1, buff_.size(), logger_.f_);
        (void)fflush(logger_.f_);
        logger_.unlock();
    }
    buff_.clear();
}
