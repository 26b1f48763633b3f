#ifndef PIIGUARD_UTIL_JSON_HPP
#define PIIGUARD_UTIL_JSON_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cctype>
#include <cstdint>
#include <cstdlib>

/**
 * @file json.hpp
 * @brief Minimal JSON document model, parser and writer for the piiguard API.
 *
 * DESIGN GOALS:
 *   - Header-only, no external JSON library.
 *   - A single Value type covering null, bool, number, string, array and object.
 *   - Objects keep insertion order so responses serialize in a stable, readable order.
 *   - Strict parsing: malformed input throws json::ParseError with the byte position.
 *   - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8; the writer emits
 *     UTF-8 verbatim and escapes only quotes, backslashes and control characters.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using piiguard::util::json::Value;
 *
 *   Value body = Value::parse(R"({"text":"Call 555-123-4567","score_threshold":0.6})");
 *   std::string text = body["text"].asString();
 *
 *   Value out = Value::object();
 *   out.set("success", true);
 *   out.set("count", 2);
 *   std::string wire = out.dump();   // {"success":true,"count":2}
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace json {

class ParseError : public std::runtime_error
{
public:
    ParseError(const std::string &msg, size_t pos)
        : std::runtime_error("json: " + msg + " at position " + std::to_string(pos))
        , position_(pos)
    {
    }

    size_t position() const { return position_; }

private:
    size_t position_;
};

class Value
{
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    Value() : type_(Type::Null), bool_(false), number_(0.0) {}
    Value(bool b) : type_(Type::Bool), bool_(b), number_(0.0) {}
    Value(int n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(long n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(long long n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(unsigned n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(unsigned long n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(unsigned long long n) : type_(Type::Number), bool_(false), number_(static_cast<double>(n)) {}
    Value(double d) : type_(Type::Number), bool_(false), number_(d) {}
    Value(const char *s) : type_(Type::String), bool_(false), number_(0.0), string_(s) {}
    Value(const std::string &s) : type_(Type::String), bool_(false), number_(0.0), string_(s) {}

    static Value array()
    {
        Value v;
        v.type_ = Type::Array;
        return v;
    }

    static Value object()
    {
        Value v;
        v.type_ = Type::Object;
        return v;
    }

    static Value fromStrings(const std::vector<std::string> &items)
    {
        Value v = array();
        for (const auto &s : items) {
            v.push_back(s);
        }
        return v;
    }

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::Null; }
    bool isBool() const { return type_ == Type::Bool; }
    bool isNumber() const { return type_ == Type::Number; }
    bool isString() const { return type_ == Type::String; }
    bool isArray() const { return type_ == Type::Array; }
    bool isObject() const { return type_ == Type::Object; }

    const char *typeName() const
    {
        switch (type_) {
        case Type::Null:   return "null";
        case Type::Bool:   return "boolean";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
        }
        return "unknown";
    }

    bool asBool() const
    {
        expect(Type::Bool);
        return bool_;
    }

    double asNumber() const
    {
        expect(Type::Number);
        return number_;
    }

    long long asInt() const
    {
        expect(Type::Number);
        if (std::floor(number_) != number_) {
            throw std::runtime_error("json: expected an integer, got " + formatNumber(number_));
        }
        return static_cast<long long>(number_);
    }

    const std::string &asString() const
    {
        expect(Type::String);
        return string_;
    }

    /// Array elements or object values, in order.
    const std::vector<Value> &items() const
    {
        if (type_ != Type::Array && type_ != Type::Object) {
            throw std::runtime_error(std::string("json: expected array or object, got ") + typeName());
        }
        return items_;
    }

    /// Object keys, parallel to items().
    const std::vector<std::string> &keys() const
    {
        expect(Type::Object);
        return keys_;
    }

    size_t size() const
    {
        return (type_ == Type::Array || type_ == Type::Object) ? items_.size() : 0;
    }

    void push_back(const Value &v)
    {
        expect(Type::Array);
        items_.push_back(v);
    }

    /**
     * @brief Insert or overwrite a member of an object.
     */
    void set(const std::string &key, const Value &v)
    {
        expect(Type::Object);
        for (size_t i = 0; i < keys_.size(); ++i) {
            if (keys_[i] == key) {
                items_[i] = v;
                return;
            }
        }
        keys_.push_back(key);
        items_.push_back(v);
    }

    bool contains(const std::string &key) const
    {
        return find(key) != nullptr;
    }

    /**
     * @brief Pointer to the member named @p key, or nullptr when absent or not an object.
     */
    const Value *find(const std::string &key) const
    {
        if (type_ != Type::Object) {
            return nullptr;
        }
        for (size_t i = 0; i < keys_.size(); ++i) {
            if (keys_[i] == key) {
                return &items_[i];
            }
        }
        return nullptr;
    }

    /**
     * @brief Member access that throws when the key is absent.
     */
    const Value &operator[](const std::string &key) const
    {
        expect(Type::Object);
        const Value *v = find(key);
        if (v == nullptr) {
            throw std::runtime_error("json: missing key '" + key + "'");
        }
        return *v;
    }

    const Value &operator[](size_t index) const
    {
        expect(Type::Array);
        if (index >= items_.size()) {
            throw std::out_of_range("json: array index " + std::to_string(index) + " out of range");
        }
        return items_[index];
    }

    std::string dump() const
    {
        std::ostringstream oss;
        write(oss);
        return oss.str();
    }

    static Value parse(const std::string &text)
    {
        Parser p(text);
        Value v = p.parseValue();
        p.skipWhitespace();
        if (!p.atEnd()) {
            throw ParseError("trailing characters after document", p.pos());
        }
        return v;
    }

    static std::string escape(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }

private:
    void expect(Type t) const
    {
        if (type_ != t) {
            Value probe;
            probe.type_ = t;
            throw std::runtime_error(std::string("json: expected ") + probe.typeName()
                                     + ", got " + typeName());
        }
    }

    static std::string formatNumber(double d)
    {
        if (!std::isfinite(d)) {
            return "null";
        }
        std::ostringstream oss;
        if (std::floor(d) == d && std::fabs(d) < 1e15) {
            oss << static_cast<long long>(d);
        } else {
            oss << std::setprecision(15) << d;
        }
        return oss.str();
    }

    void write(std::ostringstream &oss) const
    {
        switch (type_) {
        case Type::Null:
            oss << "null";
            break;
        case Type::Bool:
            oss << (bool_ ? "true" : "false");
            break;
        case Type::Number:
            oss << formatNumber(number_);
            break;
        case Type::String:
            oss << '"' << escape(string_) << '"';
            break;
        case Type::Array:
            oss << '[';
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) oss << ',';
                items_[i].write(oss);
            }
            oss << ']';
            break;
        case Type::Object:
            oss << '{';
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) oss << ',';
                oss << '"' << escape(keys_[i]) << "\":";
                items_[i].write(oss);
            }
            oss << '}';
            break;
        }
    }

    class Parser
    {
    public:
        explicit Parser(const std::string &text) : text_(text), pos_(0), depth_(0) {}

        size_t pos() const { return pos_; }
        bool atEnd() const { return pos_ >= text_.size(); }

        void skipWhitespace()
        {
            while (pos_ < text_.size()
                   && (text_[pos_] == ' ' || text_[pos_] == '\t'
                       || text_[pos_] == '\n' || text_[pos_] == '\r')) {
                ++pos_;
            }
        }

        Value parseValue()
        {
            skipWhitespace();
            if (atEnd()) {
                throw ParseError("unexpected end of input", pos_);
            }
            char c = text_[pos_];
            switch (c) {
            case '{': return parseObject();
            case '[': return parseArray();
            case '"': return Value(parseString());
            case 't': consumeLiteral("true"); return Value(true);
            case 'f': consumeLiteral("false"); return Value(false);
            case 'n': consumeLiteral("null"); return Value();
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                    return Value(parseNumber());
                }
                throw ParseError(std::string("unexpected character '") + c + "'", pos_);
            }
        }

    private:
        static constexpr int kMaxDepth = 64;

        void enter()
        {
            if (++depth_ > kMaxDepth) {
                throw ParseError("nesting too deep", pos_);
            }
        }

        void consumeLiteral(const char *lit)
        {
            std::string s(lit);
            if (text_.compare(pos_, s.size(), s) != 0) {
                throw ParseError("invalid literal", pos_);
            }
            pos_ += s.size();
        }

        Value parseObject()
        {
            enter();
            Value obj = Value::object();
            ++pos_; // '{'
            skipWhitespace();
            if (!atEnd() && text_[pos_] == '}') {
                ++pos_;
                --depth_;
                return obj;
            }
            // Duplicate keys keep the last value, as set() would, without its linear scan.
            std::unordered_map<std::string, size_t> index;
            while (true) {
                skipWhitespace();
                if (atEnd() || text_[pos_] != '"') {
                    throw ParseError("expected object key", pos_);
                }
                std::string key = parseString();
                skipWhitespace();
                if (atEnd() || text_[pos_] != ':') {
                    throw ParseError("expected ':' after key '" + key + "'", pos_);
                }
                ++pos_;
                Value member = parseValue();
                auto found = index.find(key);
                if (found != index.end()) {
                    obj.items_[found->second] = std::move(member);
                } else {
                    index.emplace(key, obj.keys_.size());
                    obj.keys_.push_back(std::move(key));
                    obj.items_.push_back(std::move(member));
                }
                skipWhitespace();
                if (atEnd()) {
                    throw ParseError("unterminated object", pos_);
                }
                if (text_[pos_] == ',') {
                    ++pos_;
                    continue;
                }
                if (text_[pos_] == '}') {
                    ++pos_;
                    break;
                }
                throw ParseError("expected ',' or '}' in object", pos_);
            }
            --depth_;
            return obj;
        }

        Value parseArray()
        {
            enter();
            Value arr = Value::array();
            ++pos_; // '['
            skipWhitespace();
            if (!atEnd() && text_[pos_] == ']') {
                ++pos_;
                --depth_;
                return arr;
            }
            while (true) {
                arr.push_back(parseValue());
                skipWhitespace();
                if (atEnd()) {
                    throw ParseError("unterminated array", pos_);
                }
                if (text_[pos_] == ',') {
                    ++pos_;
                    continue;
                }
                if (text_[pos_] == ']') {
                    ++pos_;
                    break;
                }
                throw ParseError("expected ',' or ']' in array", pos_);
            }
            --depth_;
            return arr;
        }

        double parseNumber()
        {
            size_t start = pos_;
            if (text_[pos_] == '-') ++pos_;
            if (atEnd() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                throw ParseError("invalid number", start);
            }
            while (!atEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            if (!atEnd() && text_[pos_] == '.') {
                ++pos_;
                if (atEnd() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    throw ParseError("invalid fraction", pos_);
                }
                while (!atEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            }
            if (!atEnd() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
                ++pos_;
                if (!atEnd() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
                if (atEnd() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    throw ParseError("invalid exponent", pos_);
                }
                while (!atEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            }
            return std::strtod(text_.substr(start, pos_ - start).c_str(), nullptr);
        }

        unsigned parseHex4()
        {
            if (pos_ + 4 > text_.size()) {
                throw ParseError("truncated \\u escape", pos_);
            }
            unsigned value = 0;
            for (int i = 0; i < 4; ++i) {
                char h = text_[pos_++];
                value <<= 4;
                if (h >= '0' && h <= '9') value |= static_cast<unsigned>(h - '0');
                else if (h >= 'a' && h <= 'f') value |= static_cast<unsigned>(h - 'a' + 10);
                else if (h >= 'A' && h <= 'F') value |= static_cast<unsigned>(h - 'A' + 10);
                else throw ParseError("invalid hex digit in \\u escape", pos_ - 1);
            }
            return value;
        }

        static void appendUtf8(std::string &out, unsigned cp)
        {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        std::string parseString()
        {
            ++pos_; // opening quote
            std::string out;
            while (true) {
                if (atEnd()) {
                    throw ParseError("unterminated string", pos_);
                }
                char c = text_[pos_++];
                if (c == '"') {
                    break;
                }
                if (static_cast<unsigned char>(c) < 0x20) {
                    throw ParseError("control character in string", pos_ - 1);
                }
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (atEnd()) {
                    throw ParseError("unterminated escape", pos_);
                }
                char e = text_[pos_++];
                switch (e) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = parseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (text_.compare(pos_, 2, "\\u") != 0) {
                            throw ParseError("unpaired high surrogate", pos_);
                        }
                        pos_ += 2;
                        unsigned low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            throw ParseError("invalid low surrogate", pos_);
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        throw ParseError("unpaired low surrogate", pos_);
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default:
                    throw ParseError(std::string("invalid escape '\\") + e + "'", pos_ - 1);
                }
            }
            return out;
        }

        const std::string &text_;
        size_t pos_;
        int depth_;
    };

    Type type_;
    bool bool_;
    double number_;
    std::string string_;
    std::vector<Value> items_;
    std::vector<std::string> keys_;
};

} // namespace json
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_JSON_HPP
