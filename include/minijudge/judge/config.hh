#pragma once

#include <chrono>
#include <minijudge/concat_tostr.hh>
#include <minijudge/file_path.hh>
#include <minijudge/judge/judge.hh>
#include <optional>
#include <stdexcept>
#include <string>

namespace minijudge::judge {

struct Config {
    Judge::Options judge;
    std::optional<std::string> stdlog_file;
    std::optional<std::string> errlog_file;
};

constexpr std::chrono::seconds MAX_TIMEOUT = std::chrono::hours{24};

// Converts @p seconds into a timeout, std::nullopt if it is not in the range
// [1ns, MAX_TIMEOUT]
std::optional<std::chrono::nanoseconds> timeout_from_seconds(double seconds) noexcept;

// Thrown on invalid values of configuration variables
class ConfigError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit ConfigError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}
};

/**
 * @brief Loads configuration from @p path, unset variables keep their defaults
 *
 * @errors Throws ConfigFile::ParseError on syntax errors, ConfigError on
 *   invalid values and std::runtime_error if the file cannot be read
 */
Config load_config(FilePath path);

// Like load_config() but parses @p contents
Config load_config_from_string(std::string contents);

} // namespace minijudge::judge
