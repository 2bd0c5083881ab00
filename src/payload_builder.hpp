#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Loads the payload file and switches on the requested variants. A variant
// NAME flips the first "ENABLE_NAME = False" in the payload to True.
class PayloadBuilder
{
public:
    explicit PayloadBuilder(const std::string &source);

    // Throws std::runtime_error if the file cannot be read.
    static PayloadBuilder fromFile(const std::string &path);

    // Returns false (payload unchanged) when the payload has no such toggle.
    bool enable(const std::string &variant);

    const std::string &source() const { return source_; }
    std::vector<uint8_t> bytes() const;

    // "rainbow", "auto-battle" -> RAINBOW, AUTO_BATTLE
    static std::string variantName(const std::string &flag);

private:
    std::string source_;
};
