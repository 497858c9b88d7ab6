#include <algorithm>
#include <cstddef>
#include <reglib/config_file.hh>
#include <reglib/file_contents.hh>
#include <string>
#include <utility>

using std::string;

namespace {

// White-space but not a newline
constexpr bool is_ws(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\r' or c == '\v' or c == '\f';
}

constexpr bool is_space(char c) noexcept { return c == '\n' or is_ws(c); }

// [a-zA-Z0-9\-_.]
constexpr bool is_name(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '-' or c == '_' or c == '.';
}

constexpr bool is_xdigit(char c) noexcept {
    return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F');
}

constexpr int hex2dec(char c) noexcept {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

} // namespace

void ConfigFile::load_config_from_file(const char* pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = err_pos;
        while (line_beg > 0 and config[line_beg - 1] != '\n') {
            --line_beg;
        }
        size_t line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);
        // The offending line with the faulty position stressed in the second line
        size_t line_end = config.find('\n', err_pos);
        pe.diagnostics_ = concat_tostr(
            std::string_view{config}.substr(line_beg, line_end - line_beg),
            '\n',
            string(col - 1, ' '),
            '^'
        );
        return pe;
    };

    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) -> string {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            for (++pos; config[pos] != '\n'; ++pos) {
                if (config[pos] == '\'') {
                    // Safe: newline is at the end of every line
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            for (++pos; config[pos] != '\n'; ++pos) {
                char c = config[pos];
                if (c == '"') {
                    ++pos;
                    return res;
                }
                if (c != '\\') {
                    res += c;
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // pos will not go out of the buffer (guard = newline)
                    if (!is_xdigit(config[++pos])) {
                        throw parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    if (!is_xdigit(config[++pos])) {
                        throw parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>(
                        (hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos])
                    );
                    continue;
                default:
                    throw parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t beg = pos;
        while (config[pos] != '\n' and config[pos] != '#' and
               !(is_in_array and (config[pos] == ']' or config[pos] == ',')))
        {
            ++pos;
        }
        // Remove white-spaces from ending
        size_t end = pos;
        while (end > beg and is_ws(config[end - 1])) {
            --end;
        }
        return config.substr(beg, end - beg);
    };

    while (pos < config.size()) {
        skip_ws();
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        if (pos == name_beg) {
            throw parse_error("Invalid or missing variable's name");
        }
        string name = config.substr(name_beg, pos - name_beg);

        /* Assignment operator */
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_ws();

        /* Value */
        Variable ignored;
        Variable* varp = &ignored;
        if (load_all) {
            varp = &vars[name];
        } else if (auto it = vars.find(name); it != vars.end()) {
            varp = &it->second;
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') { // Normal
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [

            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos == config.size()) {
                    throw parse_error("Missing terminating ] character at the end of an array");
                }

                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                // Delimiter
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }

                throw parse_error("Unexpected character after the value: `", config[pos], '`');
            }
        }

        /* Rest of the line */
        skip_ws();
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw parse_error("Unexpected character after the value: `", config[pos], '`');
        }
        ++pos;
    }
}
