#include "navstack/record.hpp"

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace navstack {

namespace {

std::mt19937_64& key_engine() {
    static std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

std::mutex& key_engine_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

std::string generate_record_key() {
    uint64_t a = 0;
    uint64_t b = 0;
    {
        std::lock_guard<std::mutex> lock(key_engine_mutex());
        std::uniform_int_distribution<uint64_t> dis;
        a = dis(key_engine());
        b = dis(key_engine());
    }

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF),
                  static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace navstack
