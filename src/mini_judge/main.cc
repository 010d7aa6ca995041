#include "commands/commands.hh"
#include "mini_judge_error.hh"

#include <cstring>
#include <minijudge/config_file.hh>
#include <minijudge/file_info.hh>
#include <minijudge/judge/config.hh>
#include <minijudge/logger.hh>
#include <minijudge/string_transform.hh>
#include <optional>
#include <string>

using minijudge::judge::Config;
using minijudge::judge::Judge;

namespace {

constexpr const char DEFAULT_CONFIG_PATH[] = "mini_judge.conf";

struct CmdOptions {
    std::optional<std::string> config_path;
    std::optional<std::chrono::nanoseconds> timeout;
    bool quiet = false;
    bool help = false;
};

/**
 * Parses options passed to mini-judge via arguments
 * @param argc like in main (will be modified to hold the number of non-option
 * parameters)
 * @param argv like in main (holds arguments)
 */
CmdOptions parse_options(int& argc, char** argv) {
    CmdOptions opts;
    int new_argc = 1;

    for (int i = 1; i < argc; ++i) {
        if (argv[i][0] != '-') {
            argv[new_argc++] = argv[i];
            continue;
        }

        auto is = [&](const char* short_opt, const char* long_opt) {
            return 0 == strcmp(argv[i], short_opt) or 0 == strcmp(argv[i], long_opt);
        };
        auto option_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw MiniJudgeError("option ", argv[i], " requires an argument");
            }
            return argv[++i];
        };

        if (is("-h", "--help")) {
            opts.help = true;
        } else if (is("-q", "--quiet")) {
            opts.quiet = true;
        } else if (is("-c", "--config")) {
            opts.config_path = option_value();
        } else if (is("-t", "--timeout")) {
            const char* value = option_value();
            auto seconds = str2num<double>(value);
            opts.timeout = std::nullopt;
            if (seconds) {
                opts.timeout = minijudge::judge::timeout_from_seconds(*seconds);
            }
            if (not opts.timeout) {
                throw MiniJudgeError(
                    "invalid timeout: ",
                    value,
                    " (expected seconds in range [1e-9, ",
                    minijudge::judge::MAX_TIMEOUT.count(),
                    "])"
                );
            }
        } else {
            throw MiniJudgeError("unknown option: ", argv[i]);
        }
    }

    argc = new_argc;
    argv[argc] = nullptr;
    return opts;
}

Config load_configuration(const CmdOptions& cmd_opts) {
    Config config;
    try {
        if (cmd_opts.config_path) {
            config = minijudge::judge::load_config(*cmd_opts.config_path);
        } else if (path_exists(DEFAULT_CONFIG_PATH)) {
            config = minijudge::judge::load_config(DEFAULT_CONFIG_PATH);
        }
    } catch (const ConfigFile::ParseError& e) {
        throw MiniJudgeError("config: ", e.what(), '\n', e.diagnostics());
    } catch (const minijudge::judge::ConfigError& e) {
        throw MiniJudgeError("config: ", e.what());
    }

    if (cmd_opts.timeout) {
        config.judge.timeout = *cmd_opts.timeout;
    }
    return config;
}

bool run_command(int argc, char** argv, const Judge& judge) {
    ArgvParser args(argc - 1, argv + 1);
    auto command = args.extract_next();

    if (command == "help") {
        commands::help(argv[0]);
        return true;
    }
    if (command == "languages") {
        commands::languages();
        return true;
    }
    if (command == "run") {
        return commands::run(args, judge);
    }
    if (command == "test") {
        return commands::test(args, judge);
    }

    throw MiniJudgeError("unknown command: ", command);
}

int real_main(int argc, char** argv) {
    stdlog.use(stdout);
    stdlog.label(false);
    errlog.label(false);

    try {
        auto cmd_opts = parse_options(argc, argv);
        if (cmd_opts.help) {
            commands::help(argv[0]);
            return 0;
        }
        if (argc < 2) {
            commands::help(argv[0]);
            return 1;
        }

        auto config = load_configuration(cmd_opts);
        if (config.stdlog_file) {
            stdlog.open(*config.stdlog_file);
        }
        if (config.errlog_file) {
            errlog.open(*config.errlog_file);
            errlog.label(true);
        }
        if (cmd_opts.quiet) {
            stdlog.use(nullptr);
        }

        Judge judge{std::move(config.judge)};
        return run_command(argc, argv, judge) ? 0 : 1;

    } catch (const MiniJudgeError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const std::exception& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    }
}

} // namespace

int main(int argc, char** argv) { return real_main(argc, argv); }
