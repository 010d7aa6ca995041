#pragma once

#include <minijudge/result.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minijudge::judge {

// Argument vector, every argument may contain placeholders: {source},
// {artifact} and {class}
using CommandTemplate = std::vector<std::string>;

struct LanguageProfile {
    std::string id;
    std::string source_extension; // with the leading '.'
    std::string source_stem; // source file is named <source_stem><source_extension>
    // Name of the file the compiler produces in the workspace, if it produces
    // a file under a name it is told
    std::optional<std::string> artifact_filename;
    std::optional<CommandTemplate> compile_command;
    CommandTemplate run_command;

    [[nodiscard]] bool requires_compile() const noexcept { return compile_command.has_value(); }

    [[nodiscard]] std::string source_filename() const { return source_stem + source_extension; }
};

struct UnsupportedLanguage {
    std::string language_id;
    std::vector<std::string> supported_ids; // sorted

    // "Unsupported language: <id>. Supported: <id1>, <id2>, ..."
    [[nodiscard]] std::string description() const;
};

/**
 * @brief Looks up profile of the language @p language_id
 *
 * @return pointer to an immutable, process-wide profile or UnsupportedLanguage
 *   listing all supported ids if @p language_id is unknown
 */
Result<const LanguageProfile*, UnsupportedLanguage> resolve(std::string_view language_id);

// Sorted ids of all supported languages
const std::vector<std::string>& supported_language_ids();

struct CommandPlaceholders {
    std::string source;
    std::string artifact;
    std::string class_name;
};

// Replaces every placeholder occurrence in every argument of @p templ
std::vector<std::string>
expand_command(const CommandTemplate& templ, const CommandPlaceholders& values);

} // namespace minijudge::judge
