#pragma once

#include <cstdint>
#include <map>
#include <minijudge/concat_tostr.hh>
#include <minijudge/file_path.hh>
#include <minijudge/string_transform.hh>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Config file format:
 *   # comment
 *   name = value           # value may be: bare literal, 'single quoted' (''
 *                          # escapes '), "double quoted" (C-like escapes)
 *   name: value            # ':' is an alternative assignment operator
 *   name = [a, 'b', "c"]   # array, may span many lines
 */
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError&) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError&) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        // The faulty line with the faulty position underlined
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns true for "1", "on" and "true" (case insensitive)
        [[nodiscard]] bool as_bool() const noexcept {
            return (str_ == "1" or lower_equal(str_, "on") or lower_equal(str_, "true"));
        }

        // Returns true if the value is one of the values accepted by as_bool()
        // or their negations ("0", "off", "false")
        [[nodiscard]] bool is_bool() const noexcept {
            return as_bool() or str_ == "0" or lower_equal(str_, "off") or
                lower_equal(str_, "false");
        }

        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_; // (name => value)

    // Returned for variables absent from the variable set
    static const Variable& null_var() noexcept {
        static const Variable var;
        return var;
    }

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.try_emplace(std::string{std::forward<Args>(names)}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var()
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return (it != vars_.end() ? it->second : null_var());
    }

    [[nodiscard]] const std::map<std::string, Variable, std::less<>>& get_vars() const noexcept {
        return vars_;
    }

    /**
     * @brief Loads config (variables) form file @p pathname
     * @details Uses load_config_from_string()
     *
     * @errors Throws an exception std::runtime_error if the file cannot be read
     *   and all exceptions from load_config_from_string()
     */
    void load_config_from_file(FilePath pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) form string @p config
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);
};
