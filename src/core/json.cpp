#include <parabox/core/json.hpp>

#include <cmath>
#include <cstdio>

namespace parabox {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Length of the well-formed UTF-8 sequence starting at s[i], or 0
size_t utf8_sequence_length(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
        cp = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        cp = c & 0x0F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        cp = c & 0x07;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF
    if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
        (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        return 0;
    }
    return len;
}

} // namespace

// Type checks
Json::Type Json::type() const { return type_; }
bool Json::is_null() const { return type_ == NUL; }
bool Json::is_bool() const { return type_ == BOOL; }
bool Json::is_number() const { return type_ == NUMBER; }
bool Json::is_string() const { return type_ == STRING; }
bool Json::is_array() const { return type_ == ARRAY; }
bool Json::is_object() const { return type_ == OBJECT; }

// Value accessors
bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    if (type_ != NUMBER || !(std::fabs(number_) < 9.2e18)) return def;
    return static_cast<int64_t>(number_);
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const std::vector<Json>& Json::as_array() const {
    static std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

// Object access
const Json& Json::operator[](const std::string& key) const {
    static Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

// Modifiers
void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

void Json::remove(const std::string& key) {
    if (type_ == OBJECT) object_.erase(key);
}

// Helper getters with defaults
std::string Json::get_string(const std::string& key, const std::string& def) const {
    if (type_ != OBJECT) return def;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    if (it != object_.end() && it->second.is_string()) {
        return it->second.string_;
    }
    return def;
}

int64_t Json::get_int(const std::string& key, int64_t def) const {
    if (type_ != OBJECT) return def;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    if (it != object_.end() && it->second.is_number()) {
        return it->second.as_int(def);
    }
    return def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    if (type_ != OBJECT) return def;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    if (it != object_.end() && it->second.is_bool()) {
        return it->second.bool_;
    }
    return def;
}

// Static constructors
Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

// Serialization
std::string Json::dump() const {
    std::ostringstream ss;
    dump_impl(ss);
    return ss.str();
}

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json value = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw std::runtime_error("Trailing characters at position " + std::to_string(pos));
    }
    return value;
}

void Json::dump_impl(std::ostringstream& ss) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            if (!std::isfinite(number_)) {
                ss << "null";
            } else if (std::fabs(number_) < 9.0e15 && number_ == std::floor(number_)) {
                ss << static_cast<int64_t>(number_);
            } else {
                char buf[32];
                snprintf(buf, sizeof(buf), "%.17g", number_);
                ss << buf;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                array_[i].dump_impl(ss);
            }
            ss << ']';
            break;
        case OBJECT: {
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                ss << '"';
                escape_string(ss, it->first);
                ss << "\":";
                it->second.dump_impl(ss);
            }
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c >= 0x80) {
            size_t len = utf8_sequence_length(s, i);
            if (len == 0) {
                ss << "\\ufffd";
                ++i;
            } else {
                ss.write(s.data() + i, static_cast<std::streamsize>(len));
                i += len;
            }
            continue;
        }
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    ss << buf;
                } else {
                    ss << static_cast<char>(c);
                }
        }
        ++i;
    }
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
        pos++;
    }
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > kMaxDepth) {
        throw std::runtime_error("JSON nested too deeply");
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error("Unexpected end of JSON");
    }

    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '[') return parse_array(s, pos, depth);
    if (c == '{') return parse_object(s, pos, depth);
    if (c == '-' || is_digit(c)) return parse_number(s, pos);

    throw std::runtime_error("Invalid JSON at position " + std::to_string(pos));
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw std::runtime_error("Invalid literal at position " + std::to_string(pos));
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;

    if (pos < s.size() && s[pos] == '0') {
        pos++;
    } else if (pos < s.size() && is_digit(s[pos])) {
        while (pos < s.size() && is_digit(s[pos])) pos++;
    } else {
        throw std::runtime_error("Invalid number at position " + std::to_string(start));
    }

    if (pos < s.size() && s[pos] == '.') {
        pos++;
        if (pos >= s.size() || !is_digit(s[pos])) {
            throw std::runtime_error("Invalid fraction at position " + std::to_string(start));
        }
        while (pos < s.size() && is_digit(s[pos])) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        if (pos >= s.size() || !is_digit(s[pos])) {
            throw std::runtime_error("Invalid exponent at position " + std::to_string(start));
        }
        while (pos < s.size() && is_digit(s[pos])) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    pos++; // skip opening quote
    std::string result;
    while (true) {
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated string");
        }
        unsigned char c = static_cast<unsigned char>(s[pos]);
        if (c == '"') {
            pos++;
            return result;
        }
        if (c < 0x20) {
            throw std::runtime_error("Control character in string at position " + std::to_string(pos));
        }
        if (c != '\\') {
            result += static_cast<char>(c);
            pos++;
            continue;
        }

        pos++;
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated escape");
        }
        switch (s[pos]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                uint32_t cp = 0;
                for (int k = 1; k <= 4; ++k) {
                    int h = pos + k < s.size() ? hex_value(s[pos + k]) : -1;
                    if (h < 0) throw std::runtime_error("Invalid \\u escape");
                    cp = (cp << 4) | static_cast<uint32_t>(h);
                }
                pos += 4;

                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                    s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                    uint32_t low = 0;
                    bool valid = true;
                    for (int k = 3; k <= 6; ++k) {
                        int h = hex_value(s[pos + k]);
                        if (h < 0) {
                            valid = false;
                            break;
                        }
                        low = (low << 4) | static_cast<uint32_t>(h);
                    }
                    if (valid && low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
                // Unpaired surrogates are not representable in UTF-8
                if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
                append_utf8(result, cp);
                break;
            }
            default:
                throw std::runtime_error("Invalid escape at position " + std::to_string(pos));
        }
        pos++;
    }
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // skip [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.array_.push_back(parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated array");
        }
        if (s[pos] == ',') {
            pos++;
            continue;
        }
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        throw std::runtime_error("Expected ',' or ']' at position " + std::to_string(pos));
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // skip {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw std::runtime_error("Expected key at position " + std::to_string(pos));
        }
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw std::runtime_error("Expected ':' at position " + std::to_string(pos));
        }
        pos++; // skip :
        obj.object_[key] = parse_value(s, pos, depth + 1);
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated object");
        }
        if (s[pos] == ',') {
            pos++;
            continue;
        }
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        throw std::runtime_error("Expected ',' or '}' at position " + std::to_string(pos));
    }
}

} // namespace parabox
