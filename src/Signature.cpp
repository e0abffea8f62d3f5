#include "Signature.h"

#include <bitset>
#include <cstdio>

namespace cee {

std::string hex8(std::uint32_t h) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", h);
    return std::string(buf);
}

double charSetSimilarity(const std::string& a, const std::string& b) {
    std::bitset<256> sa;
    std::bitset<256> sb;
    for (unsigned char c : a) sa.set(c);
    for (unsigned char c : b) sb.set(c);

    const std::size_t uni = (sa | sb).count();
    if (uni == 0) return 0.0;
    const std::size_t inter = (sa & sb).count();
    return static_cast<double>(inter) / static_cast<double>(uni);
}

} // namespace cee
