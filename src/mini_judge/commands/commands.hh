#pragma once

#include <minijudge/argv_parser.hh>
#include <minijudge/judge/judge.hh>

#include <string>
#include <string_view>

namespace commands {

// Reads the whole file @p path, @p what names the file in the error message
std::string read_file_arg(std::string_view path, std::string_view what);

// Displays help
void help(const char* program_name);

// Prints supported language ids, one per line
void languages();

// Returns true iff the run succeeded (and matched the expected output if
// given)
bool run(ArgvParser args, const minijudge::judge::Judge& judge);

// Returns true iff all tests passed
bool test(ArgvParser args, const minijudge::judge::Judge& judge);

} // namespace commands
