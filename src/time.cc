#include <algorithm>
#include <cstring>
#include <minijudge/macros/throw.hh>
#include <minijudge/time.hh>

using std::string;

string localdate(const char* format, time_t curr_time) {
    if (curr_time < 0) {
        time(&curr_time);
    }

    size_t format_len = std::strlen(format);
    string buff(format_len + 1 + std::count(format, format + format_len, '%') * 25, '0');

    tm ptm{};
    if (localtime_r(&curr_time, &ptm) == nullptr) {
        THROW("Failed to convert time");
    }

    size_t rc = strftime(buff.data(), buff.size(), format, &ptm);
    buff.resize(rc);
    return buff;
}

string to_seconds_str(std::chrono::nanoseconds dur, unsigned precision) {
    using std::chrono::nanoseconds;
    auto total = dur.count();
    bool negative = (total < 0);
    if (negative) {
        total = -total;
    }

    auto secs = total / nanoseconds::period::den;
    auto frac = total % nanoseconds::period::den;
    string res = concat_tostr(negative ? "-" : "", secs);
    if (precision > 0) {
        string frac_str = std::to_string(frac);
        frac_str.insert(0, 9 - frac_str.size(), '0');
        frac_str.resize(std::min<size_t>(precision, 9));
        back_insert(res, '.', frac_str);
    }
    return res;
}
