#pragma once

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "../core/hash.hpp"
#include "../core/types.hpp"
#include "ristretto255.hpp"

namespace vrlnc {

inline bool hash_to_ristretto_point(ExtPoint& out, const char* domain, uint64_t index) {
    uint8_t wide[64];
    for (uint8_t half = 0; half < 2; half++) {
        Sha256 h;
        bool good = h.init()
            && h.update(domain)
            && sha256_acc_u64(h, index)
            && h.update(&half, 1)
            && h.finish(wide + 32 * half);
        if (!good) return false;
    }
    out = rist_from_uniform_bytes(wide);
    return true;
}

// G[i] depends on (domain, i) only, so every party derives the same basis from m
struct GeneratorBasis {
    std::vector<RistrettoPoint> encoded;
    std::vector<ExtPoint> points;

    size_t size() const { return encoded.size(); }
};

inline bool derive_basis(GeneratorBasis& out, size_t m, const char* domain = Dom::GENERATORS) {
    GeneratorBasis b;
    b.encoded.resize(m);
    b.points.resize(m);
    for (size_t i = 0; i < m; i++) {
        ExtPoint P;
        if (!hash_to_ristretto_point(P, domain, i)) return false;
        b.encoded[i] = rist_encode(P);
        // multiply the decoded canonical form, not the raw map output
        if (!rist_decode(b.points[i], b.encoded[i])) return false;
    }
    out = std::move(b);
    return true;
}

inline bool basis_from_encoded(GeneratorBasis& out, std::vector<RistrettoPoint> encoded) {
    GeneratorBasis b;
    b.points.resize(encoded.size());
    for (size_t i = 0; i < encoded.size(); i++)
        if (!rist_decode(b.points[i], encoded[i])) return false;
    b.encoded = std::move(encoded);
    out = std::move(b);
    return true;
}

}
