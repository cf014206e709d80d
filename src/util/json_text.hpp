#ifndef KEYSTONE_UTIL_JSON_TEXT_HPP
#define KEYSTONE_UTIL_JSON_TEXT_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * @file json_text.hpp
 * @brief Minimal JSON string handling for the generation client.
 *
 * Only what the request/response exchange needs: escaping a string literal
 * and pulling the first string value of a key out of a response body.
 * This is not a general JSON parser.
 */

namespace keystone {
namespace util {
namespace json {

/**
 * @brief Escape characters for use inside a JSON string literal.
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

namespace detail {

inline void appendUtf8(std::string &out, uint32_t cp)
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

inline bool readHex4(const std::string &s, size_t pos, uint32_t &out)
{
    if (pos + 4 > s.size()) {
        return false;
    }
    out = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        out <<= 4;
        if (c >= '0' && c <= '9')      out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

} // namespace detail

/**
 * @brief Find the first `"key": "<string>"` pair in a JSON body and return the
 *        unescaped string.
 * @param body The raw JSON text.
 * @param key  The object key to look for.
 * @param out  Receives the decoded value.
 * @return false if the key is absent, not followed by a string, or the string
 *         is unterminated.
 */
inline bool extractStringValue(const std::string &body, const std::string &key, std::string &out)
{
    const std::string needle = "\"" + key + "\"";
    size_t pos = 0;
    while ((pos = body.find(needle, pos)) != std::string::npos) {
        size_t cur = pos + needle.size();
        while (cur < body.size() && (body[cur] == ' ' || body[cur] == '\t' ||
                                     body[cur] == '\n' || body[cur] == '\r')) {
            ++cur;
        }
        if (cur >= body.size() || body[cur] != ':') {
            pos = cur;
            continue;
        }
        ++cur;
        while (cur < body.size() && (body[cur] == ' ' || body[cur] == '\t' ||
                                     body[cur] == '\n' || body[cur] == '\r')) {
            ++cur;
        }
        if (cur >= body.size() || body[cur] != '"') {
            pos = cur;
            continue;
        }
        ++cur;

        std::string value;
        while (cur < body.size()) {
            char c = body[cur];
            if (c == '"') {
                out = value;
                return true;
            }
            if (c != '\\') {
                value.push_back(c);
                ++cur;
                continue;
            }
            if (cur + 1 >= body.size()) {
                return false;
            }
            char e = body[cur + 1];
            cur += 2;
            switch (e) {
            case '"':  value.push_back('"');  break;
            case '\\': value.push_back('\\'); break;
            case '/':  value.push_back('/');  break;
            case 'b':  value.push_back('\b'); break;
            case 'f':  value.push_back('\f'); break;
            case 'n':  value.push_back('\n'); break;
            case 'r':  value.push_back('\r'); break;
            case 't':  value.push_back('\t'); break;
            case 'u': {
                uint32_t cp = 0;
                if (!detail::readHex4(body, cur, cp)) {
                    return false;
                }
                cur += 4;
                // surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && cur + 6 <= body.size() &&
                    body[cur] == '\\' && body[cur + 1] == 'u') {
                    uint32_t low = 0;
                    if (detail::readHex4(body, cur + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        cur += 6;
                    }
                }
                detail::appendUtf8(value, cp);
                break;
            }
            default:
                return false;
            }
        }
        return false;
    }
    return false;
}

} // namespace json
} // namespace util
} // namespace keystone

#endif // KEYSTONE_UTIL_JSON_TEXT_HPP
