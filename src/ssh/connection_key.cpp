#include "connection_key.hpp"
#include <fmt/format.h>
#include <atomic>
#include <cstdint>
#include <random>

ConnectionKey ConnectionKey::generate() {
    static std::atomic<uint64_t> sequence{0};
    static const uint64_t prefix = [] {
        std::random_device rd;
        std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
        return rng();
    }();
    return ConnectionKey(fmt::format("ssh-{:016x}-{}", prefix, ++sequence));
}
