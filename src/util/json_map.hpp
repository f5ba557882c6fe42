#ifndef CHUNKWORKER_UTIL_JSON_MAP_HPP
#define CHUNKWORKER_UTIL_JSON_MAP_HPP

#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file json_map.hpp
 * @brief Encodes and decodes flat JSON objects of string values.
 *
 * The snapshot stores a chunk's file list as {"name":"url",...}. Only that shape
 * is supported; nested objects, arrays, numbers and literals are rejected.
 *
 * Usage Example:
 *   @code
 *   std::map<std::string, std::string> files{{"blocks.parquet", "https://..."}};
 *   std::string text = chunkworker::util::json::encodeStringMap(files);
 *   auto back = chunkworker::util::json::decodeStringMap(text);
 *   @endcode
 */

namespace chunkworker {
namespace util {
namespace json {

/**
 * @brief Escape a string for inclusion between JSON quotes.
 */
inline std::string escapeString(const std::string &in)
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

/**
 * @brief Serialize a map as a JSON object. Keys come out in map order.
 */
inline std::string encodeStringMap(const std::map<std::string, std::string> &values)
{
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto &kv : values) {
        if (!first) {
            oss << ",";
        }
        oss << "\"" << escapeString(kv.first) << "\":\"" << escapeString(kv.second) << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

namespace detail {

class Reader
{
public:
    explicit Reader(const std::string &text) : text_(text), pos_(0) {}

    void skipWhitespace()
    {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool atEnd() const { return pos_ >= text_.size(); }

    char peek() const
    {
        if (atEnd()) {
            fail("unexpected end of input");
        }
        return text_[pos_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool consume(char c)
    {
        if (!atEnd() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (true) {
            if (atEnd()) {
                fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("raw control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (atEnd()) {
                fail("dangling escape");
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
            case 'u':  appendCodePoint(out, readCodePoint()); break;
            default:
                fail(std::string("invalid escape '\\") + e + "'");
            }
        }
    }

    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("json: " + what + " at offset " + std::to_string(pos_));
    }

private:
    uint32_t readHex4()
    {
        if (pos_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("invalid hex digit in \\u escape");
        }
        return value;
    }

    uint32_t readCodePoint()
    {
        uint32_t cp = readHex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            // High surrogate must be followed by a low surrogate
            if (!(consume('\\') && consume('u'))) {
                fail("unpaired surrogate");
            }
            uint32_t low = readHex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate");
        }
        return cp;
    }

    static void appendCodePoint(std::string &out, uint32_t cp)
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

    const std::string &text_;
    size_t pos_;
};

} // namespace detail

/**
 * @brief Parse a JSON object whose values are all strings.
 * @throw std::runtime_error on malformed input, non-string values or duplicate keys.
 */
inline std::map<std::string, std::string> decodeStringMap(const std::string &text)
{
    detail::Reader reader(text);
    std::map<std::string, std::string> out;

    reader.skipWhitespace();
    reader.expect('{');
    reader.skipWhitespace();
    if (!reader.consume('}')) {
        while (true) {
            reader.skipWhitespace();
            std::string key = reader.readString();
            reader.skipWhitespace();
            reader.expect(':');
            reader.skipWhitespace();
            if (reader.peek() != '"') {
                reader.fail("value for key '" + key + "' is not a string");
            }
            std::string value = reader.readString();
            if (!out.emplace(key, value).second) {
                reader.fail("duplicate key '" + key + "'");
            }
            reader.skipWhitespace();
            if (reader.consume(',')) {
                continue;
            }
            reader.expect('}');
            break;
        }
    }
    reader.skipWhitespace();
    if (!reader.atEnd()) {
        reader.fail("trailing characters");
    }
    return out;
}

} // namespace json
} // namespace util
} // namespace chunkworker

#endif // CHUNKWORKER_UTIL_JSON_MAP_HPP
