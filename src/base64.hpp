#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 base64, the encoding MicroPython's ubinascii.a2b_base64 accepts.
namespace codec
{
std::string base64Encode(const uint8_t* data, size_t len);
std::string base64Encode(const std::vector<uint8_t> &data);

// False on characters outside the alphabet or a bad length.
bool base64Decode(const std::string &text, std::vector<uint8_t> &out);

// Encoded length of n input bytes.
inline size_t base64Length(size_t n) { return ((n + 2) / 3) * 4; }
} // namespace codec
