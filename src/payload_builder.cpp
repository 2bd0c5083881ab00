#include "payload_builder.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

PayloadBuilder::PayloadBuilder(const std::string &source) : source_(source) {}

PayloadBuilder PayloadBuilder::fromFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("cannot open payload " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw std::runtime_error("cannot read payload " + path);
    return PayloadBuilder(ss.str());
}

bool PayloadBuilder::enable(const std::string &variant)
{
    std::string name = variantName(variant);
    const std::string off = "ENABLE_" + name + " = False";
    size_t pos = source_.find(off);
    if (pos == std::string::npos)
        return false;
    source_.replace(pos, off.size(), "ENABLE_" + name + " = True");
    return true;
}

std::vector<uint8_t> PayloadBuilder::bytes() const
{
    return std::vector<uint8_t>(source_.begin(), source_.end());
}

std::string PayloadBuilder::variantName(const std::string &flag)
{
    std::string n = flag;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    if (n.rfind("ENABLE_", 0) == 0)
        n.erase(0, 7);
    return n;
}
