#include "base64.hpp"

namespace codec
{
static const char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int decodeChar(char c)
{
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64Encode(const uint8_t* data, size_t len)
{
    std::string out;
    out.reserve(base64Length(len));
    size_t i = 0;
    for (; i + 2 < len; i += 3)
    {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back(ALPHABET[v & 0x3F]);
    }
    size_t rest = len - i;
    if (rest == 1)
    {
        uint32_t v = uint32_t(data[i]) << 16;
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out += "==";
    }
    else if (rest == 2)
    {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string base64Encode(const std::vector<uint8_t> &data)
{
    return base64Encode(data.data(), data.size());
}

bool base64Decode(const std::string &text, std::vector<uint8_t> &out)
{
    out.clear();
    if (text.size() % 4 != 0)
        return false;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4)
    {
        int pad = 0;
        uint32_t v = 0;
        for (size_t j = 0; j < 4; ++j)
        {
            char c = text[i + j];
            if (c == '=')
            {
                // padding only in the last quad, positions 2 and 3
                if (i + 4 != text.size() || j < 2)
                    return false;
                ++pad;
                v <<= 6;
                continue;
            }
            if (pad > 0)
                return false;
            int d = decodeChar(c);
            if (d < 0)
                return false;
            v = (v << 6) | static_cast<uint32_t>(d);
        }
        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    return true;
}
} // namespace codec
