#include <algorithm>
#include <minijudge/config_file.hh>
#include <minijudge/file_contents.hh>

using std::string;

namespace {

constexpr bool is_name_char(char c) noexcept {
    return ('a' <= c and c <= 'z') or ('A' <= c and c <= 'Z') or ('0' <= c and c <= '9') or
        c == '-' or c == '_' or c == '.';
}

constexpr bool is_blank(char c) noexcept { return c != '\n' and is_space(c); }

constexpr int hex2dec(char c) noexcept {
    if ('0' <= c and c <= '9') {
        return c - '0';
    }
    if ('a' <= c and c <= 'f') {
        return c - 'a' + 10;
    }
    if ('A' <= c and c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

constexpr char dec2hex(int x) noexcept { return static_cast<char>(x < 10 ? '0' + x : 'a' + x - 10); }

} // namespace

void ConfigFile::load_config_from_file(FilePath pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto throw_parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = config.rfind('\n', err_pos == 0 ? 0 : err_pos - 1);
        line_beg = (line_beg == string::npos or line_beg >= err_pos ? 0 : line_beg + 1);
        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1;

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (c >= 32 and c < 127) {
                diags += static_cast<char>(c);
            } else {
                back_insert(diags, "\\x", dec2hex(c >> 4), dec2hex(c & 15));
            }
        };

        constexpr size_t CONTEXT = 32;
        size_t left = line_beg;
        if (err_pos - line_beg > CONTEXT) {
            diags += "...";
            left = err_pos - CONTEXT;
        }
        for (size_t k = left; k < err_pos; ++k) {
            append_char(config[k]);
        }

        size_t padding = diags.size();
        size_t stress_len = 1;
        if (config[err_pos] != '\n') {
            append_char(config[err_pos]);
            stress_len = diags.size() - padding;

            size_t k = err_pos + 1;
            for (; config[k] != '\n' and k <= err_pos + CONTEXT; ++k) {
                append_char(config[k]);
            }
            if (config[k] != '\n') {
                diags += "...";
            }
        }

        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        diags.append(stress_len - 1, '~');
        throw std::move(pe);
    };

    auto skip_blanks = [&] {
        while (is_blank(config[pos])) {
            ++pos;
        }
    };

    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case '0': res += '\0'; continue;
                case 'x': {
                    int hi = hex2dec(config[++pos]);
                    if (hi < 0) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    int lo = hex2dec(config[++pos]);
                    if (lo < 0) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>((hi << 4) | lo);
                    continue;
                }
                default:
                    throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // Bare literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t end = pos;
        auto is_terminator = [&](char c) {
            return c == '\n' or c == '#' or (is_in_array and (c == ']' or c == ','));
        };
        while (not is_terminator(config[end])) {
            ++end;
        }

        res = trimmed(std::string_view{config}.substr(pos, end - pos));
        pos = end;
        return res;
    };

    Variable ignored;
    while (pos < config.size()) {
        skip_blanks();
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        // Variable name
        size_t name_beg = pos;
        while (is_name_char(config[pos])) {
            ++pos;
        }
        if (pos == name_beg) {
            throw_parse_error("Invalid or missing variable's name");
        }
        string name = config.substr(name_beg, pos - name_beg);

        // Assignment operator
        skip_blanks();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_blanks();

        Variable* varp = &ignored;
        if (load_all) {
            varp = &vars_[name];
        } else if (auto it = vars_.find(name); it != vars_.end()) {
            varp = &it->second;
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') {
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else {
            var.flag_ |= Variable::ARRAY;
            ++pos; // '['
            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos >= config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ',') { // Ignore extra delimiters
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_blanks();
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                } else if (config[pos] == '#') {
                    skip_comment();
                } else if (config[pos] == ']') {
                    ++pos;
                    break;
                } else {
                    throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
                }
            }
        }

        // After the value
        skip_blanks();
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
        }
        ++pos;
    }
}
