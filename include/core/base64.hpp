#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dpgw::base64 {

/**
 * @brief RFC 4648 encoding
 * @param url_safe Use the URL alphabet (-_) and omit padding, as JWT requires
 */
inline std::string encode(std::string_view data, bool url_safe = false) {
    static constexpr char kStandard[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    static constexpr char kUrl[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    const char* chars = url_safe ? kUrl : kStandard;

    std::string result;
    result.reserve(4 * ((data.size() + 2) / 3));

    const size_t len = data.size();
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        result += chars[(n >> 18) & 0x3F];
        result += chars[(n >> 12) & 0x3F];
        if (i + 1 < len) {
            result += chars[(n >> 6) & 0x3F];
        } else if (!url_safe) {
            result += '=';
        }
        if (i + 2 < len) {
            result += chars[n & 0x3F];
        } else if (!url_safe) {
            result += '=';
        }
    }
    return result;
}

inline std::string encode_url(std::string_view data) {
    return encode(data, true);
}

} // namespace dpgw::base64
