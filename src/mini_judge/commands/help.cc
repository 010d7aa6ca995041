#include "commands.hh"

#include <cstdio>

namespace commands {

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "mini-judge";
    }

    printf("Usage: %s [options] <command> [<command args>]\n", program_name);
    puts(R"==(Compiles, runs and judges programs written in one of the supported languages.

Commands:
  help                  Display this information
  languages             List supported languages
  run <language> <source> [<input> [<expected>]]
                        Run <source> once with the contents of <input> as the
                          standard input (empty if not given). If <expected> is
                          given, compare the output with its contents.
  test <language> <source> <tests-dir>
                        Run <source> on every test in <tests-dir>. A test is a
                          pair of files <name>.in and <name>.out, tests are
                          run in the order of their names.

Options:
  -c <file>, --config <file>
                        Load configuration from <file> (default: mini_judge.conf
                          if it exists)
  -h, --help            Display this information
  -q, --quiet           Quiet mode: print nothing but errors
  -t <seconds>, --timeout <seconds>
                        Set the time limit of every compilation and every run,
                          overrides the configuration

Exit status is 0 iff the run / all the tests passed.)==");
}

void languages() {
    for (const auto& id : minijudge::judge::supported_language_ids()) {
        puts(id.c_str());
    }
}

} // namespace commands
