#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "../core/bytes.hpp"
#include "../core/types.hpp"
#include "../crypto/commitment.hpp"
#include "../crypto/scalar.hpp"

namespace vrlnc {

inline size_t scalars_for_chunk(size_t chunk_size) {
    const size_t bits = DEFAULT_PARAMS.bits_per_scalar;
    return (chunk_size * 8 + bits - 1) / bits;
}

inline Status split_block(size_t block_len, size_t num_chunks, size_t& chunk_size) {
    if (num_chunks == 0 || block_len == 0) return Status::SizeMismatch;
    if (block_len % num_chunks != 0) return Status::SizeMismatch;
    chunk_size = block_len / num_chunks;
    return Status::Ok;
}

// word j holds bits [252j, 252j + 252) of the little-endian bit stream
inline Status pack_chunk(const uint8_t* data, size_t len, size_t m, Chunk& out) {
    const size_t words = scalars_for_chunk(len);
    if (words > m) return Status::SizeMismatch;

    auto at = [&](size_t i) -> uint8_t { return i < len ? data[i] : 0; };

    out.assign(m, sc_zero());
    for (size_t j = 0; j < words; j++) {
        size_t off = j * DEFAULT_PARAMS.bits_per_scalar;
        size_t base = off >> 3;
        unsigned shift = off & 7;

        uint8_t w[32];
        for (size_t k = 0; k < 32; k++) {
            uint8_t lo = at(base + k) >> shift;
            uint8_t hi = shift ? (uint8_t)(at(base + k + 1) << (8 - shift)) : 0;
            w[k] = lo | hi;
        }
        w[31] &= 0x0F;
        out[j] = sc_from_bytes(w);
    }
    return Status::Ok;
}

inline Status pack_chunk(const Bytes& data, size_t m, Chunk& out) {
    return pack_chunk(data.data(), data.size(), m, out);
}

// appends len bytes to out; words >= 2^252 or set bits past len are rejected
inline Status unpack_chunk(const Chunk& chunk, size_t len, Bytes& out) {
    const size_t start = out.size();
    out.resize(start + len, 0);
    uint8_t* dst = out.data() + start;

    bool clean = true;
    auto put = [&](size_t i, uint8_t bits) {
        if (i < len) dst[i] |= bits;
        else if (bits) clean = false;
    };

    for (size_t j = 0; j < chunk.size(); j++) {
        uint8_t w[32];
        sc_tobytes(w, chunk[j]);
        if (w[31] & 0xF0) clean = false;

        size_t off = j * DEFAULT_PARAMS.bits_per_scalar;
        size_t base = off >> 3;
        unsigned shift = off & 7;

        for (size_t k = 0; k < 32; k++) {
            uint8_t v = k == 31 ? (w[k] & 0x0F) : w[k];
            if (shift) {
                put(base + k, (uint8_t)(v << shift));
                put(base + k + 1, (uint8_t)(v >> (8 - shift)));
            } else {
                put(base + k, v);
            }
        }
    }

    if (!clean) {
        out.resize(start);
        return Status::InvalidMessage;
    }
    return Status::Ok;
}

}
