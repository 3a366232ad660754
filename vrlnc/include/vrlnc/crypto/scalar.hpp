#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "field25519.hpp"
#include "../core/random.hpp"

namespace vrlnc {

// integers mod l = 2^252 + 27742317777372353535851937790883648493
struct Scalar {
    uint64_t v[4];
};

static constexpr uint64_t SC_L[4] = {
    0x5812631a5cf5d3edULL,
    0x14def9dea2f79cd6ULL,
    0x0000000000000000ULL,
    0x1000000000000000ULL
};

inline Scalar sc_zero() { return {{0, 0, 0, 0}}; }
inline Scalar sc_one()  { return {{1, 0, 0, 0}}; }

inline Scalar sc_from_u64(uint64_t x) { return {{x, 0, 0, 0}}; }

inline bool sc_eq(const Scalar& a, const Scalar& b) {
    uint64_t d = 0;
    for (int i = 0; i < 4; i++) d |= a.v[i] ^ b.v[i];
    return d == 0;
}

inline bool sc_is_zero(const Scalar& a) {
    return sc_eq(a, sc_zero());
}

// a < l
inline bool sc_is_canonical(const Scalar& a) {
    for (int i = 3; i >= 0; i--) {
        if (a.v[i] < SC_L[i]) return true;
        if (a.v[i] > SC_L[i]) return false;
    }
    return false;
}

inline Scalar sc_from_bytes(const uint8_t s[32]) {
    Scalar r;
    for (int i = 0; i < 4; i++) r.v[i] = load_le64(s + i * 8);
    return r;
}

inline void sc_tobytes(uint8_t s[32], const Scalar& a) {
    for (int i = 0; i < 4; i++) store_le64(s + i * 8, a.v[i]);
}

// Horner over 64-bit words: r = r * 2^64 + w[i], then 2^252 is folded back as
// -(l - 2^252). r stays below l between steps.
inline Scalar sc_reduce512(const uint64_t w[8]) {
    uint64_t r[5] = {0, 0, 0, 0, 0};

    for (int i = 7; i >= 0; i--) {
        r[4] = r[3]; r[3] = r[2]; r[2] = r[1]; r[1] = r[0]; r[0] = w[i];

        // r < 2^317 here, hi = r >> 252 needs 65 bits
        u128 hi = ((u128)r[4] << 4) | (r[3] >> 60);
        r[3] &= 0x0FFFFFFFFFFFFFFFULL;
        r[4] = 0;
        if (hi == 0) continue;

        uint64_t hi_lo = (uint64_t)hi;
        uint64_t hi_hi = (uint64_t)(hi >> 64);

        u128 p0 = (u128)hi_lo * SC_L[0];
        u128 p1 = (u128)hi_lo * SC_L[1] + (uint64_t)(p0 >> 64) + (hi_hi ? SC_L[0] : 0);
        uint64_t sub[3] = {
            (uint64_t)p0,
            (uint64_t)p1,
            (uint64_t)(p1 >> 64) + (hi_hi ? SC_L[1] : 0)
        };

        uint64_t borrow = 0;
        for (int k = 0; k < 4; k++) {
            u128 d = (u128)r[k] - (k < 3 ? sub[k] : 0) - borrow;
            r[k] = (uint64_t)d;
            borrow = (uint64_t)(d >> 64) & 1;
        }

        if (borrow) {
            u128 carry = 0;
            for (int k = 0; k < 4; k++) {
                carry += (u128)r[k] + SC_L[k];
                r[k] = (uint64_t)carry;
                carry >>= 64;
            }
        }
    }

    Scalar out{{r[0], r[1], r[2], r[3]}};
    if (!sc_is_canonical(out)) {
        uint64_t borrow = 0;
        for (int k = 0; k < 4; k++) {
            u128 d = (u128)out.v[k] - SC_L[k] - borrow;
            out.v[k] = (uint64_t)d;
            borrow = (uint64_t)(d >> 64) & 1;
        }
    }
    return out;
}

inline Scalar sc_add(const Scalar& a, const Scalar& b) {
    uint64_t w[8] = {0};
    u128 carry = 0;
    for (int i = 0; i < 4; i++) {
        carry += (u128)a.v[i] + b.v[i];
        w[i] = (uint64_t)carry;
        carry >>= 64;
    }
    w[4] = (uint64_t)carry;
    return sc_reduce512(w);
}

inline Scalar sc_neg(const Scalar& a) {
    if (sc_is_zero(a)) return a;
    Scalar r;
    uint64_t borrow = 0;
    for (int i = 0; i < 4; i++) {
        u128 d = (u128)SC_L[i] - a.v[i] - borrow;
        r.v[i] = (uint64_t)d;
        borrow = (uint64_t)(d >> 64) & 1;
    }
    return r;
}

inline Scalar sc_sub(const Scalar& a, const Scalar& b) {
    return sc_add(a, sc_neg(b));
}

inline Scalar sc_mul(const Scalar& a, const Scalar& b) {
    uint64_t w[8] = {0};
    for (int i = 0; i < 4; i++) {
        u128 carry = 0;
        for (int j = 0; j < 4; j++) {
            carry += (u128)a.v[i] * b.v[j] + w[i + j];
            w[i + j] = (uint64_t)carry;
            carry >>= 64;
        }
        w[i + 4] = (uint64_t)carry;
    }
    return sc_reduce512(w);
}

// a + b * c, the row update of elimination
inline Scalar sc_muladd(const Scalar& a, const Scalar& b, const Scalar& c) {
    return sc_add(a, sc_mul(b, c));
}

// a^(l-2), zero maps to zero
inline Scalar sc_inv(const Scalar& a) {
    const uint64_t exp[4] = {SC_L[0] - 2, SC_L[1], SC_L[2], SC_L[3]};

    Scalar result = sc_one();
    Scalar base = a;
    for (int i = 0; i < 253; i++) {
        if ((exp[i >> 6] >> (i & 63)) & 1)
            result = sc_mul(result, base);
        base = sc_mul(base, base);
    }
    return result;
}

// uniform mod l from 512 random bits
inline bool sc_random(Scalar& out) {
    uint8_t buf[64];
    if (!csprng_bytes(buf, sizeof(buf))) return false;
    uint64_t w[8];
    for (int i = 0; i < 8; i++) w[i] = load_le64(buf + i * 8);
    out = sc_reduce512(w);
    return true;
}

inline Scalar sc_random(SeedableRng& rng) {
    uint64_t w[8];
    for (int i = 0; i < 8; i++) w[i] = rng.u64();
    return sc_reduce512(w);
}

inline bool sc_random_vec(std::vector<Scalar>& out, size_t n) {
    out.resize(n);
    for (size_t i = 0; i < n; i++)
        if (!sc_random(out[i])) return false;
    return true;
}

inline std::vector<Scalar> sc_random_vec(size_t n, SeedableRng& rng) {
    std::vector<Scalar> out(n);
    for (auto& s : out) s = sc_random(rng);
    return out;
}

}
