#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <utility>

#include "field25519.hpp"
#include "scalar.hpp"

namespace vrlnc {

using RistrettoPoint = std::array<uint8_t, 32>;

// extended twisted Edwards coordinates, x = X/Z, y = Y/Z, xy = T/Z
struct ExtPoint {
    Fe25519 X, Y, Z, T;
};

namespace rc {

inline const Fe25519& d() {
    static const uint8_t b[32] = {
        0xa3, 0x78, 0x59, 0x13, 0xca, 0x4d, 0xeb, 0x75,
        0xab, 0xd8, 0x41, 0x41, 0x4d, 0x0a, 0x70, 0x00,
        0x98, 0xe8, 0x79, 0x77, 0x79, 0x40, 0xc7, 0x8c,
        0x73, 0xfe, 0x6f, 0x2b, 0xee, 0x6c, 0x03, 0x52
    };
    static const Fe25519 v = fe_const(b);
    return v;
}

inline const Fe25519& d2() {
    static const Fe25519 v = fe_add(d(), d());
    return v;
}

inline const Fe25519& sqrtm1() {
    static const uint8_t b[32] = {
        0xb0, 0xa0, 0x0e, 0x4a, 0x27, 0x1b, 0xee, 0xc4,
        0x78, 0xe4, 0x2f, 0xad, 0x06, 0x18, 0x43, 0x2f,
        0xa7, 0xd7, 0xfb, 0x3d, 0x99, 0x00, 0x4d, 0x2b,
        0x0b, 0xdf, 0xc1, 0x4f, 0x80, 0x24, 0x83, 0x2b
    };
    static const Fe25519 v = fe_const(b);
    return v;
}

inline const Fe25519& invsqrt_a_minus_d() {
    static const uint8_t b[32] = {
        0xea, 0x40, 0x5d, 0x80, 0xaa, 0xfd, 0xc8, 0x99,
        0xbe, 0x72, 0x41, 0x5a, 0x17, 0x16, 0x2f, 0x9d,
        0x40, 0xd8, 0x01, 0xfe, 0x91, 0x7b, 0xc2, 0x16,
        0xa2, 0xfc, 0xaf, 0xcf, 0x05, 0x89, 0x6c, 0x78
    };
    static const Fe25519 v = fe_const(b);
    return v;
}

inline const Fe25519& sqrt_ad_minus_one() {
    static const uint8_t b[32] = {
        0x1b, 0x2e, 0x7b, 0x49, 0xa0, 0xf6, 0x97, 0x7e,
        0xbd, 0x54, 0x78, 0x1b, 0x0c, 0x8e, 0x9d, 0xaf,
        0xfd, 0xd1, 0xf5, 0x31, 0xc9, 0xfc, 0x3c, 0x0f,
        0xac, 0x48, 0x83, 0x2b, 0xbf, 0x31, 0x69, 0x37
    };
    static const Fe25519 v = fe_const(b);
    return v;
}

inline const Fe25519& one_minus_d_sq() {
    static const Fe25519 v = fe_sub(fe_one(), fe_sq(d()));
    return v;
}

inline const Fe25519& d_minus_one_sq() {
    static const Fe25519 v = fe_sq(fe_sub(d(), fe_one()));
    return v;
}

}

inline ExtPoint ext_identity() {
    return {fe_zero(), fe_one(), fe_one(), fe_zero()};
}

// dbl-2008-hwcd, a = -1
inline ExtPoint ext_double(const ExtPoint& P) {
    Fe25519 A = fe_sq(P.X);
    Fe25519 B = fe_sq(P.Y);
    Fe25519 zz = fe_sq(P.Z);
    Fe25519 C = fe_add(zz, zz);
    Fe25519 D = fe_neg(A);
    Fe25519 E = fe_sub(fe_sq(fe_add(P.X, P.Y)), fe_add(A, B));
    Fe25519 G = fe_add(D, B);
    Fe25519 F = fe_sub(G, C);
    Fe25519 H = fe_sub(D, B);
    return {fe_mul(E, F), fe_mul(G, H), fe_mul(F, G), fe_mul(E, H)};
}

// add-2008-hwcd-3, a = -1
inline ExtPoint ext_add(const ExtPoint& P, const ExtPoint& Q) {
    Fe25519 A = fe_mul(fe_sub(P.Y, P.X), fe_sub(Q.Y, Q.X));
    Fe25519 B = fe_mul(fe_add(P.Y, P.X), fe_add(Q.Y, Q.X));
    Fe25519 C = fe_mul(fe_mul(P.T, Q.T), rc::d2());
    Fe25519 zz = fe_mul(P.Z, Q.Z);
    Fe25519 D = fe_add(zz, zz);
    Fe25519 E = fe_sub(B, A);
    Fe25519 F = fe_sub(D, C);
    Fe25519 G = fe_add(D, C);
    Fe25519 H = fe_add(B, A);
    return {fe_mul(E, F), fe_mul(G, H), fe_mul(F, G), fe_mul(E, H)};
}

inline ExtPoint ext_neg(const ExtPoint& P) {
    return {fe_neg(P.X), P.Y, P.Z, fe_neg(P.T)};
}

inline ExtPoint ext_sub(const ExtPoint& P, const ExtPoint& Q) {
    return ext_add(P, ext_neg(Q));
}

inline ExtPoint ext_scalarmul(const ExtPoint& P, const Scalar& s) {
    uint8_t sb[32];
    sc_tobytes(sb, s);

    ExtPoint R = ext_identity();
    ExtPoint Q = P;
    for (int i = 0; i < 253; i++) {
        if ((sb[i >> 3] >> (i & 7)) & 1) R = ext_add(R, Q);
        Q = ext_double(Q);
    }
    return R;
}

// SQRT_RATIO_M1(u, v) of RFC 9496: (u/v is square, |sqrt(u/v)| or |sqrt(i*u/v)|)
inline std::pair<bool, Fe25519> fe_sqrt_ratio(const Fe25519& u, const Fe25519& v) {
    Fe25519 v3 = fe_mul(fe_sq(v), v);
    Fe25519 v7 = fe_mul(fe_sq(v3), v);
    Fe25519 r = fe_mul(fe_mul(u, v3), fe_pow2523(fe_mul(u, v7)));
    Fe25519 check = fe_mul(v, fe_sq(r));

    Fe25519 u_neg = fe_neg(u);
    bool correct = fe_eq(check, u);
    bool flipped = fe_eq(check, u_neg);
    bool flipped_i = fe_eq(check, fe_mul(u_neg, rc::sqrtm1()));

    r = fe_cmov(r, fe_mul(r, rc::sqrtm1()), flipped || flipped_i);
    return {correct || flipped, fe_abs(r)};
}

inline RistrettoPoint rist_encode(const ExtPoint& P) {
    Fe25519 u1 = fe_mul(fe_add(P.Z, P.Y), fe_sub(P.Z, P.Y));
    Fe25519 u2 = fe_mul(P.X, P.Y);

    Fe25519 inv = fe_sqrt_ratio(fe_one(), fe_mul(u1, fe_sq(u2))).second;
    Fe25519 den1 = fe_mul(inv, u1);
    Fe25519 den2 = fe_mul(inv, u2);
    Fe25519 z_inv = fe_mul(fe_mul(den1, den2), P.T);

    Fe25519 ix = fe_mul(P.X, rc::sqrtm1());
    Fe25519 iy = fe_mul(P.Y, rc::sqrtm1());
    Fe25519 enchanted = fe_mul(den1, rc::invsqrt_a_minus_d());

    bool rotate = fe_is_negative(fe_mul(P.T, z_inv));
    Fe25519 X = fe_cmov(P.X, iy, rotate);
    Fe25519 Y = fe_cmov(P.Y, ix, rotate);
    Fe25519 den_inv = fe_cmov(den2, enchanted, rotate);

    Y = fe_cneg(Y, fe_is_negative(fe_mul(X, z_inv)));
    Fe25519 s = fe_abs(fe_mul(den_inv, fe_sub(P.Z, Y)));

    RistrettoPoint out;
    fe_tobytes(out.data(), s);
    return out;
}

// rejects non-canonical and negative field encodings as well as non-points
inline bool rist_decode(ExtPoint& P, const RistrettoPoint& bytes) {
    Fe25519 s = fe_frombytes(bytes.data());

    uint8_t canon[32];
    fe_tobytes(canon, s);
    if (memcmp(canon, bytes.data(), 32) != 0) return false;
    if (fe_is_negative(s)) return false;

    Fe25519 ss = fe_sq(s);
    Fe25519 u1 = fe_sub(fe_one(), ss);
    Fe25519 u2 = fe_add(fe_one(), ss);
    Fe25519 u2_sq = fe_sq(u2);
    Fe25519 v = fe_sub(fe_neg(fe_mul(rc::d(), fe_sq(u1))), u2_sq);

    auto [was_square, I] = fe_sqrt_ratio(fe_one(), fe_mul(v, u2_sq));
    if (!was_square) return false;

    Fe25519 den_x = fe_mul(I, u2);
    Fe25519 den_y = fe_mul(fe_mul(I, den_x), v);
    Fe25519 x = fe_abs(fe_mul(fe_add(s, s), den_x));
    Fe25519 y = fe_mul(u1, den_y);
    Fe25519 t = fe_mul(x, y);
    if (fe_is_negative(t) || fe_is_zero(y)) return false;

    P = {x, y, fe_one(), t};
    return true;
}

inline bool rist_is_valid(const RistrettoPoint& bytes) {
    ExtPoint P;
    return rist_decode(P, bytes);
}

inline RistrettoPoint rist_identity() {
    return rist_encode(ext_identity());
}

inline bool rist_add(RistrettoPoint& out, const RistrettoPoint& a, const RistrettoPoint& b) {
    ExtPoint P, Q;
    if (!rist_decode(P, a) || !rist_decode(Q, b)) return false;
    out = rist_encode(ext_add(P, Q));
    return true;
}

inline bool rist_scalarmul(RistrettoPoint& out, const RistrettoPoint& pt, const Scalar& s) {
    ExtPoint P;
    if (!rist_decode(P, pt)) return false;
    out = rist_encode(ext_scalarmul(P, s));
    return true;
}

// Elligator map of one field element (MAP in RFC 9496)
inline ExtPoint rist_elligator(const Fe25519& t) {
    Fe25519 r = fe_mul(rc::sqrtm1(), fe_sq(t));
    Fe25519 u = fe_mul(fe_add(r, fe_one()), rc::one_minus_d_sq());
    Fe25519 v = fe_mul(fe_sub(fe_neg(fe_one()), fe_mul(r, rc::d())), fe_add(r, rc::d()));

    auto [was_square, s] = fe_sqrt_ratio(u, v);
    Fe25519 s_prime = fe_neg(fe_abs(fe_mul(s, t)));
    s = fe_cmov(s_prime, s, was_square);
    Fe25519 c = fe_cmov(r, fe_neg(fe_one()), was_square);

    Fe25519 N = fe_sub(fe_mul(fe_mul(c, fe_sub(r, fe_one())), rc::d_minus_one_sq()), v);
    Fe25519 w0 = fe_mul(fe_add(s, s), v);
    Fe25519 w1 = fe_mul(N, rc::sqrt_ad_minus_one());
    Fe25519 ss = fe_sq(s);
    Fe25519 w2 = fe_sub(fe_one(), ss);
    Fe25519 w3 = fe_add(fe_one(), ss);

    return {fe_mul(w0, w3), fe_mul(w2, w1), fe_mul(w1, w3), fe_mul(w0, w2)};
}

// one-way map from 64 uniform bytes, the sum of two Elligator images
inline ExtPoint rist_from_uniform_bytes(const uint8_t b[64]) {
    uint8_t h[32];
    memcpy(h, b, 32);
    h[31] &= 0x7f;
    Fe25519 t1 = fe_frombytes(h);
    memcpy(h, b + 32, 32);
    h[31] &= 0x7f;
    Fe25519 t2 = fe_frombytes(h);
    return ext_add(rist_elligator(t1), rist_elligator(t2));
}

}
