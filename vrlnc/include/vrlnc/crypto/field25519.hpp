#pragma once

#include <cstdint>
#include <cstring>
#include <utility>

namespace vrlnc {

using u128 = unsigned __int128;

// GF(2^255 - 19), five 51-bit limbs
struct Fe25519 {
    uint64_t v[5];
};

static constexpr uint64_t FE_MASK51 = (1ULL << 51) - 1;

inline Fe25519 fe_zero() { return {{0, 0, 0, 0, 0}}; }
inline Fe25519 fe_one()  { return {{1, 0, 0, 0, 0}}; }

inline Fe25519 fe_carry(Fe25519 h) {
    for (int i = 0; i < 4; i++) {
        h.v[i + 1] += h.v[i] >> 51;
        h.v[i] &= FE_MASK51;
    }
    h.v[0] += 19 * (h.v[4] >> 51);
    h.v[4] &= FE_MASK51;
    h.v[1] += h.v[0] >> 51;
    h.v[0] &= FE_MASK51;
    return h;
}

inline Fe25519 fe_add(const Fe25519& f, const Fe25519& g) {
    Fe25519 h;
    for (int i = 0; i < 5; i++) h.v[i] = f.v[i] + g.v[i];
    return fe_carry(h);
}

// adds 2p before subtracting so no limb underflows
inline Fe25519 fe_sub(const Fe25519& f, const Fe25519& g) {
    static constexpr uint64_t TWO_P[5] = {
        (1ULL << 52) - 38, (1ULL << 52) - 2, (1ULL << 52) - 2,
        (1ULL << 52) - 2,  (1ULL << 52) - 2
    };
    Fe25519 h;
    for (int i = 0; i < 5; i++) h.v[i] = (f.v[i] + TWO_P[i]) - g.v[i];
    return fe_carry(h);
}

inline Fe25519 fe_neg(const Fe25519& f) {
    return fe_sub(fe_zero(), f);
}

inline Fe25519 fe_mul(const Fe25519& f, const Fe25519& g) {
    const uint64_t* a = f.v;
    uint64_t b19[5];
    for (int i = 1; i < 5; i++) b19[i] = 19 * g.v[i];

    u128 t[5];
    t[0] = (u128)a[0]*g.v[0] + (u128)a[1]*b19[4] + (u128)a[2]*b19[3] + (u128)a[3]*b19[2] + (u128)a[4]*b19[1];
    t[1] = (u128)a[0]*g.v[1] + (u128)a[1]*g.v[0] + (u128)a[2]*b19[4] + (u128)a[3]*b19[3] + (u128)a[4]*b19[2];
    t[2] = (u128)a[0]*g.v[2] + (u128)a[1]*g.v[1] + (u128)a[2]*g.v[0] + (u128)a[3]*b19[4] + (u128)a[4]*b19[3];
    t[3] = (u128)a[0]*g.v[3] + (u128)a[1]*g.v[2] + (u128)a[2]*g.v[1] + (u128)a[3]*g.v[0] + (u128)a[4]*b19[4];
    t[4] = (u128)a[0]*g.v[4] + (u128)a[1]*g.v[3] + (u128)a[2]*g.v[2] + (u128)a[3]*g.v[1] + (u128)a[4]*g.v[0];

    Fe25519 h;
    uint64_t c = 0;
    for (int i = 0; i < 5; i++) {
        t[i] += c;
        h.v[i] = (uint64_t)t[i] & FE_MASK51;
        c = (uint64_t)(t[i] >> 51);
    }
    h.v[0] += c * 19;
    h.v[1] += h.v[0] >> 51;
    h.v[0] &= FE_MASK51;
    return h;
}

inline Fe25519 fe_sq(const Fe25519& f) {
    return fe_mul(f, f);
}

inline Fe25519 fe_sqn(Fe25519 f, int n) {
    for (int i = 0; i < n; i++) f = fe_sq(f);
    return f;
}

// z^((p-5)/8) = z^(2^252 - 3)
inline Fe25519 fe_pow2523(const Fe25519& z) {
    Fe25519 z2 = fe_sq(z);
    Fe25519 z9 = fe_mul(z, fe_sqn(z2, 2));
    Fe25519 z11 = fe_mul(z9, z2);
    Fe25519 e5 = fe_mul(z9, fe_sq(z11));          // 2^5 - 1
    Fe25519 e10 = fe_mul(fe_sqn(e5, 5), e5);      // 2^10 - 1
    Fe25519 e20 = fe_mul(fe_sqn(e10, 10), e10);
    Fe25519 e40 = fe_mul(fe_sqn(e20, 20), e20);
    Fe25519 e50 = fe_mul(fe_sqn(e40, 10), e10);
    Fe25519 e100 = fe_mul(fe_sqn(e50, 50), e50);
    Fe25519 e200 = fe_mul(fe_sqn(e100, 100), e100);
    Fe25519 e250 = fe_mul(fe_sqn(e200, 50), e50);
    return fe_mul(fe_sqn(e250, 2), z);
}

inline uint64_t load_le64(const uint8_t* s) {
    uint64_t r = 0;
    for (int i = 0; i < 8; i++) r |= (uint64_t)s[i] << (i * 8);
    return r;
}

inline void store_le64(uint8_t* s, uint64_t v) {
    for (int i = 0; i < 8; i++) s[i] = (uint8_t)(v >> (i * 8));
}

// the top bit is ignored, values in [p, 2^255) are reduced
inline Fe25519 fe_frombytes(const uint8_t s[32]) {
    uint64_t w0 = load_le64(s), w1 = load_le64(s + 8);
    uint64_t w2 = load_le64(s + 16), w3 = load_le64(s + 24) & 0x7fffffffffffffffULL;
    Fe25519 h = {{
        w0 & FE_MASK51,
        ((w0 >> 51) | (w1 << 13)) & FE_MASK51,
        ((w1 >> 38) | (w2 << 26)) & FE_MASK51,
        ((w2 >> 25) | (w3 << 39)) & FE_MASK51,
        w3 >> 12
    }};
    return fe_carry(h);
}

inline void fe_tobytes(uint8_t s[32], Fe25519 h) {
    h = fe_carry(h);

    // q = 1 iff h >= p
    uint64_t q = (h.v[0] + 19) >> 51;
    for (int i = 1; i < 5; i++) q = (h.v[i] + q) >> 51;

    h.v[0] += 19 * q;
    for (int i = 0; i < 4; i++) {
        h.v[i + 1] += h.v[i] >> 51;
        h.v[i] &= FE_MASK51;
    }
    h.v[4] &= FE_MASK51;

    store_le64(s,      h.v[0] | (h.v[1] << 51));
    store_le64(s + 8,  (h.v[1] >> 13) | (h.v[2] << 38));
    store_le64(s + 16, (h.v[2] >> 26) | (h.v[3] << 25));
    store_le64(s + 24, (h.v[3] >> 39) | (h.v[4] << 12));
}

inline bool fe_eq(const Fe25519& f, const Fe25519& g) {
    uint8_t a[32], b[32];
    fe_tobytes(a, f);
    fe_tobytes(b, g);
    uint8_t d = 0;
    for (int i = 0; i < 32; i++) d |= a[i] ^ b[i];
    return d == 0;
}

inline bool fe_is_zero(const Fe25519& f) {
    return fe_eq(f, fe_zero());
}

inline bool fe_is_negative(const Fe25519& f) {
    uint8_t s[32];
    fe_tobytes(s, f);
    return s[0] & 1;
}

// g when b, else f
inline Fe25519 fe_cmov(const Fe25519& f, const Fe25519& g, bool b) {
    uint64_t mask = (uint64_t)(-(int64_t)b);
    Fe25519 h;
    for (int i = 0; i < 5; i++) h.v[i] = f.v[i] ^ (mask & (f.v[i] ^ g.v[i]));
    return h;
}

inline Fe25519 fe_cneg(const Fe25519& f, bool b) {
    return fe_cmov(f, fe_neg(f), b);
}

inline Fe25519 fe_abs(const Fe25519& f) {
    return fe_cneg(f, fe_is_negative(f));
}

inline Fe25519 fe_const(const uint8_t bytes[32]) {
    return fe_frombytes(bytes);
}

}
