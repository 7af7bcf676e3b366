#pragma once

#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <variant>
#include <expected>
#include <cctype>
#include <cmath>
#include <charconv>
#include <cstdint>
#include <cstdio>

namespace leakscan::json {

class Value;
using Null = std::monostate;
using Boolean = bool;
using Number = double;
using String = std::string;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

class Value {
public:
    using VariantType = std::variant<Null, Boolean, Number, String, Array, Object>;
    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(int i) : data_(static_cast<double>(i)) {}
    Value(int64_t i) : data_(static_cast<double>(i)) {}
    Value(size_t i) : data_(static_cast<double>(i)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Boolean>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    // Integral numbers only (1.0 counts, 1.5 does not)
    bool is_integer() const {
        return is_number() && std::isfinite(as_number()) && std::floor(as_number()) == as_number();
    }

    bool as_bool() const { return std::get<Boolean>(data_); }
    double as_number() const { return std::get<Number>(data_); }
    int64_t as_int() const { return static_cast<int64_t>(std::get<Number>(data_)); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    Object& as_object() { return std::get<Object>(data_); }

    const Value& operator[](const std::string& key) const {
        static const Value null_value;
        if (!is_object()) return null_value;
        const auto& obj = as_object();
        auto it = obj.find(key);
        return it != obj.end() ? it->second : null_value;
    }

    bool contains(const std::string& key) const {
        return is_object() && as_object().count(key) > 0;
    }

private:
    VariantType data_;
};

struct ParseErrorInfo {
    size_t offset;
    std::string message;
};

namespace detail {

class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    std::expected<Value, ParseErrorInfo> parse_document() {
        skip_ws();
        auto v = parse_value(0);
        if (!v) return v;
        skip_ws();
        if (pos_ != in_.size()) return fail("trailing characters after value");
        return v;
    }

private:
    static constexpr int kMaxDepth = 256;

    std::string_view in_;
    size_t pos_ = 0;

    std::unexpected<ParseErrorInfo> fail(std::string msg) const {
        return std::unexpected(ParseErrorInfo{pos_, std::move(msg)});
    }

    void skip_ws() {
        while (pos_ < in_.size() && (in_[pos_] == ' ' || in_[pos_] == '\t' || in_[pos_] == '\n' || in_[pos_] == '\r')) pos_++;
    }

    bool consume(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    std::expected<Value, ParseErrorInfo> parse_value(int depth) {
        if (depth > kMaxDepth) return fail("nesting too deep");
        if (pos_ >= in_.size()) return fail("unexpected end of input");
        char c = in_[pos_];
        switch (c) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': {
                auto s = parse_string();
                if (!s) return std::unexpected(s.error());
                return Value(std::move(*s));
            }
            case 't': if (consume("true")) return Value(true); return fail("invalid literal");
            case 'f': if (consume("false")) return Value(false); return fail("invalid literal");
            case 'n': if (consume("null")) return Value(); return fail("invalid literal");
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
                return fail(std::string("unexpected character '") + c + "'");
        }
    }

    std::expected<Value, ParseErrorInfo> parse_object(int depth) {
        Object obj;
        pos_++; // '{'
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '}') { pos_++; return Value(std::move(obj)); }
        while (true) {
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != '"') return fail("expected object key");
            auto key = parse_string();
            if (!key) return std::unexpected(key.error());
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != ':') return fail("expected ':' after key");
            pos_++;
            skip_ws();
            auto val = parse_value(depth + 1);
            if (!val) return val;
            obj.insert_or_assign(std::move(*key), std::move(*val));
            skip_ws();
            if (pos_ >= in_.size()) return fail("unterminated object");
            if (in_[pos_] == ',') { pos_++; continue; }
            if (in_[pos_] == '}') { pos_++; break; }
            return fail("expected ',' or '}' in object");
        }
        return Value(std::move(obj));
    }

    std::expected<Value, ParseErrorInfo> parse_array(int depth) {
        Array arr;
        pos_++; // '['
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == ']') { pos_++; return Value(std::move(arr)); }
        while (true) {
            skip_ws();
            auto val = parse_value(depth + 1);
            if (!val) return val;
            arr.push_back(std::move(*val));
            skip_ws();
            if (pos_ >= in_.size()) return fail("unterminated array");
            if (in_[pos_] == ',') { pos_++; continue; }
            if (in_[pos_] == ']') { pos_++; break; }
            return fail("expected ',' or ']' in array");
        }
        return Value(std::move(arr));
    }

    std::expected<Value, ParseErrorInfo> parse_number() {
        size_t start = pos_;
        if (in_[pos_] == '-') pos_++;
        auto digits = [&] {
            size_t n = 0;
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) { pos_++; n++; }
            return n;
        };
        if (digits() == 0) return fail("invalid number");
        if (pos_ < in_.size() && in_[pos_] == '.') {
            pos_++;
            if (digits() == 0) return fail("invalid fraction");
        }
        if (pos_ < in_.size() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            pos_++;
            if (pos_ < in_.size() && (in_[pos_] == '+' || in_[pos_] == '-')) pos_++;
            if (digits() == 0) return fail("invalid exponent");
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, d);
        if (ec != std::errc() || ptr != in_.data() + pos_) return fail("number out of range");
        return Value(d);
    }

    static void append_utf8(std::string& out, uint32_t cp) {
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

    std::expected<uint32_t, ParseErrorInfo> parse_hex4() {
        if (pos_ + 4 > in_.size()) return fail("truncated unicode escape");
        uint32_t cp = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + pos_, in_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc() || ptr != in_.data() + pos_ + 4) return fail("invalid unicode escape");
        pos_ += 4;
        return cp;
    }

    std::expected<std::string, ParseErrorInfo> parse_string() {
        std::string out;
        pos_++; // opening quote
        while (pos_ < in_.size()) {
            char c = in_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
            if (c != '\\') { out += c; continue; }
            if (pos_ >= in_.size()) break;
            char esc = in_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) return std::unexpected(cp.error());
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF && consume("\\u")) {
                        auto lo = parse_hex4();
                        if (!lo) return std::unexpected(lo.error());
                        if (*lo >= 0xDC00 && *lo <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (*lo - 0xDC00);
                        } else {
                            append_utf8(out, code);
                            code = *lo;
                        }
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
        return fail("unterminated string");
    }
};

inline void dump_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

inline void dump_value(std::string& out, const Value& v) {
    if (v.is_null()) {
        out += "null";
    } else if (v.is_bool()) {
        out += v.as_bool() ? "true" : "false";
    } else if (v.is_number()) {
        double d = v.as_number();
        if (!std::isfinite(d)) { out += "null"; return; }
        char buf[32];
        std::to_chars_result r;
        if (v.is_integer() && std::fabs(d) < 9.0e15) {
            r = std::to_chars(buf, buf + sizeof(buf), static_cast<int64_t>(d));
        } else {
            r = std::to_chars(buf, buf + sizeof(buf), d);
        }
        out.append(buf, r.ptr);
    } else if (v.is_string()) {
        dump_string(out, v.as_string());
    } else if (v.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : v.as_array()) {
            if (!first) out += ',';
            first = false;
            dump_value(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : v.as_object()) {
            if (!first) out += ',';
            first = false;
            dump_string(out, key);
            out += ':';
            dump_value(out, item);
        }
        out += '}';
    }
}

} // namespace detail

// Strict RFC 8259 parse of a single document
inline std::expected<Value, ParseErrorInfo> parse(std::string_view input) {
    return detail::Parser(input).parse_document();
}

// Compact serialization, object keys in sorted order
inline std::string dump(const Value& value) {
    std::string out;
    detail::dump_value(out, value);
    return out;
}

} // namespace leakscan::json
