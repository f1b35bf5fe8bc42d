// serialization.cpp - JSON writer and reader for Value snapshots

#include <geo_nodes/serialization.h>
#include <geo_nodes/errors.h>

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace geo_nodes {

namespace {

// ============================================================
// Writer
// ============================================================

class JsonWriter {
public:
    explicit JsonWriter(bool compact) : compact_(compact) {}

    std::string finish(const Value& root) {
        write(root, 0);
        return std::move(out_);
    }

private:
    std::string out_;
    Path path_;
    bool compact_;

    void newline(std::size_t depth) {
        if (!compact_) {
            out_ += '\n';
            out_.append(depth * 2, ' ');
        }
    }

    void write_string(std::string_view s) {
        static constexpr char hex[] = "0123456789abcdef";
        out_ += '"';
        for (const char c : s) {
            switch (c) {
                case '"':  out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\n': out_ += "\\n"; break;
                case '\r': out_ += "\\r"; break;
                case '\t': out_ += "\\t"; break;
                case '\b': out_ += "\\b"; break;
                case '\f': out_ += "\\f"; break;
                default: {
                    const auto u = static_cast<unsigned char>(c);
                    if (u < 0x20) {
                        out_ += "\\u00";
                        out_ += hex[u >> 4];
                        out_ += hex[u & 0xF];
                    } else {
                        out_ += c;
                    }
                }
            }
        }
        out_ += '"';
    }

    void write(const Value& val, std::size_t depth) {
        if (const auto* m = val.get_if<ValueMap>()) {
            write_map(val, *m, depth);
        } else if (const auto* v = val.get_if<ValueVector>()) {
            write_vector(*v, depth);
        } else if (const auto* d = val.get_if<double>()) {
            if (!std::isfinite(*d)) {
                throw SerializationError("non-finite number at " + path_to_string(path_) +
                                         " cannot be written as JSON");
            }
            out_ += detail::format_double(*d);
        } else if (const auto* i = val.get_if<int64_t>()) {
            out_ += std::to_string(*i);
        } else if (const auto* b = val.get_if<bool>()) {
            out_ += *b ? "true" : "false";
        } else if (const auto* s = val.get_if<std::string>()) {
            write_string(*s);
        } else {
            out_ += "null";
        }
    }

    void write_map(const Value& val, const ValueMap& m, std::size_t depth) {
        if (m.empty()) {
            out_ += "{}";
            return;
        }
        out_ += '{';
        const char* separator = "";
        for (const auto& key : val.keys()) {
            out_ += separator;
            separator = ",";
            newline(depth + 1);
            write_string(key);
            out_ += compact_ ? ":" : ": ";
            path_.push_back(key);
            write(m.find(key)->get(), depth + 1);
            path_.pop_back();
        }
        newline(depth);
        out_ += '}';
    }

    void write_vector(const ValueVector& v, std::size_t depth) {
        if (v.empty()) {
            out_ += "[]";
            return;
        }
        out_ += '[';
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
                out_ += ',';
            }
            newline(depth + 1);
            path_.push_back(i);
            write(v[i].get(), depth + 1);
            path_.pop_back();
        }
        newline(depth);
        out_ += ']';
    }
};

// ============================================================
// Reader
// ============================================================

struct SyntaxError {
    std::string reason;
    std::size_t offset;
};

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document() {
        skip_space();
        if (at_end()) {
            fail("empty input");
        }
        Value root = read_value(0);
        skip_space();
        if (!at_end()) {
            fail("unexpected trailing characters");
        }
        return root;
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(std::string reason) const {
        throw SyntaxError{std::move(reason), pos_};
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_space() {
        while (!at_end() && (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                             text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_space();
        if (peek() != c) {
            fail(std::string{"expected '"} + c + "'");
        }
        ++pos_;
    }

    bool consume_literal(std::string_view word) {
        if (text_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    Value read_value(std::size_t depth) {
        skip_space();
        const char c = peek();
        if (c == '{' || c == '[') {
            if (depth >= max_json_depth) {
                fail("nesting too deep");
            }
            return c == '{' ? read_object(depth + 1) : read_array(depth + 1);
        }
        if (c == '"') {
            return Value{read_string()};
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return read_number();
        }
        if (consume_literal("true")) return Value{true};
        if (consume_literal("false")) return Value{false};
        if (consume_literal("null")) return Value{};
        fail(at_end() ? "unexpected end of input" : "unexpected character");
    }

    Value read_object(std::size_t depth) {
        ++pos_;  // '{'
        auto entries = ValueMap{}.transient();
        skip_space();
        if (peek() == '}') {
            ++pos_;
            return Value{entries.persistent()};
        }
        while (true) {
            skip_space();
            if (peek() != '"') {
                fail("expected a string key");
            }
            std::string key = read_string();
            expect(':');
            Value item = read_value(depth);
            entries.set(std::move(key), ValueBox{std::move(item)});

            skip_space();
            if (peek() == ',') {
                ++pos_;
            } else if (peek() == '}') {
                ++pos_;
                return Value{entries.persistent()};
            } else {
                fail("expected ',' or '}'");
            }
        }
    }

    Value read_array(std::size_t depth) {
        ++pos_;  // '['
        auto items = ValueVector{}.transient();
        skip_space();
        if (peek() == ']') {
            ++pos_;
            return Value{items.persistent()};
        }
        while (true) {
            items.push_back(ValueBox{read_value(depth)});
            skip_space();
            if (peek() == ',') {
                ++pos_;
            } else if (peek() == ']') {
                ++pos_;
                return Value{items.persistent()};
            } else {
                fail("expected ',' or ']'");
            }
        }
    }

    // Exactly four hex digits
    char32_t read_hex4() {
        if (pos_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        unsigned value = 0;
        const auto* first = text_.data() + pos_;
        const auto result = std::from_chars(first, first + 4, value, 16);
        if (result.ec != std::errc{} || result.ptr != first + 4) {
            fail("invalid \\u escape");
        }
        pos_ += 4;
        return static_cast<char32_t>(value);
    }

    static void append_utf8(std::string& out, char32_t cp) {
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

    char32_t read_code_point() {
        const char32_t unit = read_hex4();
        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            fail("unpaired low surrogate");
        }
        if (unit < 0xD800 || unit > 0xDBFF) {
            return unit;
        }
        if (!consume_literal("\\u")) {
            fail("unpaired high surrogate");
        }
        const char32_t low = read_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("invalid low surrogate");
        }
        return 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    }

    std::string read_string() {
        ++pos_;  // opening quote
        std::string out;
        while (true) {
            if (at_end()) {
                fail("unterminated string");
            }
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                fail("unterminated escape");
            }
            switch (text_[pos_++]) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  append_utf8(out, read_code_point()); break;
                default:
                    --pos_;
                    fail("invalid escape");
            }
        }
    }

    bool digit_at(std::size_t i) const {
        return i < text_.size() && text_[i] >= '0' && text_[i] <= '9';
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    Value read_number() {
        const std::size_t start = pos_;
        std::size_t i = pos_;
        if (text_[i] == '-') {
            ++i;
        }
        if (!digit_at(i)) {
            fail("invalid number");
        }
        if (text_[i] == '0') {
            ++i;
        } else {
            while (digit_at(i)) ++i;
        }

        bool integral = true;
        if (i < text_.size() && text_[i] == '.') {
            integral = false;
            ++i;
            if (!digit_at(i)) {
                pos_ = i;
                fail("expected digits after '.'");
            }
            while (digit_at(i)) ++i;
        }
        if (i < text_.size() && (text_[i] == 'e' || text_[i] == 'E')) {
            integral = false;
            ++i;
            if (i < text_.size() && (text_[i] == '+' || text_[i] == '-')) {
                ++i;
            }
            if (!digit_at(i)) {
                pos_ = i;
                fail("expected exponent digits");
            }
            while (digit_at(i)) ++i;
        }
        pos_ = i;

        const char* first = text_.data() + start;
        const char* last = text_.data() + i;
        if (integral) {
            int64_t n = 0;
            const auto result = std::from_chars(first, last, n);
            if (result.ec == std::errc{}) {
                return Value{n};
            }
            // Too large for int64: keep it as a double
        }

        // strtod reports subnormal results with ERANGE but still returns them
        const std::string token(first, last);
        errno = 0;
        const double d = std::strtod(token.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) {
            pos_ = start;
            fail("number out of range");
        }
        return Value{d};
    }
};

} // namespace

std::string to_json(const Value& val, bool compact)
{
    return JsonWriter{compact}.finish(val);
}

Value from_json(const std::string& text, std::string* error_out)
{
    try {
        return JsonReader{text}.read_document();
    } catch (const SyntaxError& e) {
        if (error_out) {
            *error_out = e.reason + " at offset " + std::to_string(e.offset);
        }
        return Value{};
    }
}

} // namespace geo_nodes
