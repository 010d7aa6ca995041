#include <minijudge/config_file.hh>
#include <minijudge/file_info.hh>
#include <minijudge/judge/config.hh>

using std::string;

namespace minijudge::judge {

namespace {

Config config_from(const ConfigFile& cf) {
    Config config;

    if (const auto& var = cf["timeout_in_seconds"]; var.is_set()) {
        auto seconds = var.as<double>();
        std::optional<std::chrono::nanoseconds> timeout;
        if (seconds) {
            timeout = timeout_from_seconds(*seconds);
        }
        if (not timeout) {
            throw ConfigError(
                "timeout_in_seconds: expected a number of seconds in range [1e-9, ",
                MAX_TIMEOUT.count(),
                "], got: `",
                var.as_string(),
                '`'
            );
        }
        config.judge.timeout = *timeout;
    }

    if (const auto& var = cf["workspace_parent_dir"]; var.is_set()) {
        if (var.is_array() or not is_directory(var.as_string())) {
            throw ConfigError(
                "workspace_parent_dir: not a directory: `", var.as_string(), '`'
            );
        }
        config.judge.workspace_parent_dir = var.as_string();
    }

    if (const auto& var = cf["compile_once_per_batch"]; var.is_set()) {
        if (not var.is_bool()) {
            throw ConfigError(
                "compile_once_per_batch: expected a boolean, got: `", var.as_string(), '`'
            );
        }
        config.judge.compile_once_per_batch = var.as_bool();
    }

    auto load_path = [&](const char* name, std::optional<string>& dest) {
        const auto& var = cf[name];
        if (not var.is_set()) {
            return;
        }
        if (var.is_array() or var.as_string().empty()) {
            throw ConfigError(name, ": expected a file path");
        }
        dest = var.as_string();
    };
    load_path("stdlog_file", config.stdlog_file);
    load_path("errlog_file", config.errlog_file);

    return config;
}

ConfigFile make_config_file() {
    ConfigFile cf;
    cf.add_vars(
        "timeout_in_seconds",
        "workspace_parent_dir",
        "compile_once_per_batch",
        "stdlog_file",
        "errlog_file"
    );
    return cf;
}

} // namespace

std::optional<std::chrono::nanoseconds> timeout_from_seconds(double seconds) noexcept {
    using std::chrono::nanoseconds;
    // Also rejects NaN, the bound keeps the conversion below in range
    if (not(seconds > 0 and seconds <= static_cast<double>(MAX_TIMEOUT.count()))) {
        return std::nullopt;
    }
    auto timeout = std::chrono::round<nanoseconds>(std::chrono::duration<double>{seconds});
    if (timeout < nanoseconds{1}) {
        return std::nullopt;
    }
    return timeout;
}

Config load_config(FilePath path) {
    auto cf = make_config_file();
    cf.load_config_from_file(path);
    return config_from(cf);
}

Config load_config_from_string(string contents) {
    auto cf = make_config_file();
    cf.load_config_from_string(std::move(contents));
    return config_from(cf);
}

} // namespace minijudge::judge
