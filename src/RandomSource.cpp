#include "RandomSource.h"

#include <random>

namespace cee {

std::uint32_t entropySeed() {
    std::random_device rd;
    return static_cast<std::uint32_t>(rd());
}

} // namespace cee
