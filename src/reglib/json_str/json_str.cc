#include <reglib/json_str/json_str.hh>
#include <string>
#include <string_view>

namespace json_str {

void append_stringified_json(std::string& str, std::string_view val) {
    static constexpr char hex_digits[] = "0123456789abcdef";
    str.reserve(str.size() + val.size() + 2);
    str += '"';
    for (char c : val) {
        switch (c) {
        case '"': str += "\\\""; break;
        case '\\': str += "\\\\"; break;
        case '\b': str += "\\b"; break;
        case '\f': str += "\\f"; break;
        case '\n': str += "\\n"; break;
        case '\r': str += "\\r"; break;
        case '\t': str += "\\t"; break;
        default: {
            auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20 or uc == 0x7f) {
                str += "\\u00";
                str += hex_digits[uc >> 4];
                str += hex_digits[uc & 15];
            } else {
                str += c;
            }
        }
        }
    }
    str += '"';
}

} // namespace json_str
