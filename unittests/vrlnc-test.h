#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vrlnc/vrlnc.hpp"

namespace vrlnc_test {

inline std::vector<uint8_t> from_hex(const std::string& hex) {
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++)
        out[i] = (uint8_t)std::stoul(hex.substr(2 * i, 2), nullptr, 16);
    return out;
}

inline vrlnc::RistrettoPoint point_from_hex(const std::string& hex) {
    vrlnc::RistrettoPoint p{};
    std::vector<uint8_t> b = from_hex(hex);
    for (size_t i = 0; i < p.size() && i < b.size(); i++) p[i] = b[i];
    return p;
}

inline vrlnc::Scalar scalar_from_hex(const std::string& hex) {
    std::vector<uint8_t> b = from_hex(hex);
    b.resize(32, 0);
    return vrlnc::sc_from_bytes(b.data());
}

// reproducible stream per test label
inline vrlnc::SeedableRng test_rng(const char* label, uint64_t index = 0) {
    uint8_t seed[32];
    if (!vrlnc::derive_seed(label, index, seed)) return vrlnc::SeedableRng{};
    return vrlnc::make_seeded_rng(seed);
}

inline vrlnc::Bytes random_block(vrlnc::SeedableRng& rng, size_t len) {
    vrlnc::Bytes b(len);
    rng.fill(b.data(), b.size());
    return b;
}

}
