#include <algorithm>
#include <map>
#include <minijudge/concat_tostr.hh>
#include <minijudge/judge/language_profile.hh>

using std::string;
using std::vector;

namespace minijudge::judge {

namespace {

const std::map<string, LanguageProfile, std::less<>>& registry() {
    static const std::map<string, LanguageProfile, std::less<>> profiles = [] {
        std::map<string, LanguageProfile, std::less<>> res;
        auto add = [&res](LanguageProfile profile) {
            string id = profile.id;
            res.emplace(std::move(id), std::move(profile));
        };

        add({
            .id = "c",
            .source_extension = ".c",
            .source_stem = "code",
            .artifact_filename = "program",
            .compile_command = CommandTemplate{"gcc", "-o", "{artifact}", "{source}"},
            .run_command = {"{artifact}"},
        });
        add({
            .id = "cpp",
            .source_extension = ".cpp",
            .source_stem = "code",
            .artifact_filename = "program",
            .compile_command = CommandTemplate{"g++", "-o", "{artifact}", "{source}"},
            .run_command = {"{artifact}"},
        });
        // javac names the class file after the public class, hence the stem
        add({
            .id = "java",
            .source_extension = ".java",
            .source_stem = "Main",
            .artifact_filename = std::nullopt,
            .compile_command = CommandTemplate{"javac", "{source}"},
            .run_command = {"java", "{class}"},
        });
        add({
            .id = "python",
            .source_extension = ".py",
            .source_stem = "code",
            .artifact_filename = std::nullopt,
            .compile_command = std::nullopt,
            .run_command = {"python3", "{source}"},
        });
        return res;
    }();
    return profiles;
}

} // namespace

string UnsupportedLanguage::description() const {
    string res = concat_tostr("Unsupported language: ", language_id, ". Supported: ");
    for (size_t i = 0; i < supported_ids.size(); ++i) {
        back_insert(res, (i == 0 ? "" : ", "), supported_ids[i]);
    }
    return res;
}

Result<const LanguageProfile*, UnsupportedLanguage> resolve(std::string_view language_id) {
    const auto& profiles = registry();
    if (auto it = profiles.find(language_id); it != profiles.end()) {
        return Ok{&it->second};
    }
    return Err{UnsupportedLanguage{
        .language_id = string{language_id},
        .supported_ids = supported_language_ids(),
    }};
}

const vector<string>& supported_language_ids() {
    static const vector<string> ids = [] {
        vector<string> res;
        for (const auto& [id, profile] : registry()) {
            res.emplace_back(id);
        }
        return res; // std::map keeps them sorted
    }();
    return ids;
}

vector<string> expand_command(const CommandTemplate& templ, const CommandPlaceholders& values) {
    const std::pair<std::string_view, const string&> placeholders[] = {
        {"{source}", values.source},
        {"{artifact}", values.artifact},
        {"{class}", values.class_name},
    };

    vector<string> res;
    res.reserve(templ.size());
    for (const auto& arg : templ) {
        string expanded;
        for (size_t pos = 0; pos < arg.size();) {
            auto it = std::find_if(
                std::begin(placeholders),
                std::end(placeholders),
                [&](const auto& p) {
                    return std::string_view{arg}.substr(pos).starts_with(p.first);
                }
            );
            if (it == std::end(placeholders)) {
                expanded += arg[pos++];
            } else {
                expanded += it->second;
                pos += it->first.size();
            }
        }
        res.emplace_back(std::move(expanded));
    }
    return res;
}

} // namespace minijudge::judge
