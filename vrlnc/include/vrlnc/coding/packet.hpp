#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "../core/bytes.hpp"
#include "../core/hash.hpp"
#include "../core/types.hpp"
#include "../crypto/commitment.hpp"
#include "../crypto/scalar.hpp"

namespace vrlnc {

struct Packet {
    std::vector<Scalar> coding_vector;
    Chunk payload;
    std::vector<Commitment> commitments;
};

namespace detail {

inline void put_scalars(ByteWriter& w, const std::vector<Scalar>& v) {
    w.put_u64(v.size());
    uint8_t b[32];
    for (const auto& s : v) {
        sc_tobytes(b, s);
        w.put_raw(b, 32);
    }
}

inline void put_points(ByteWriter& w, const std::vector<Commitment>& v) {
    w.put_u64(v.size());
    for (const auto& p : v) w.put_array(p);
}

inline bool get_scalars(ByteReader& r, std::vector<Scalar>& v, size_t limit) {
    uint64_t n = 0;
    if (!r.get_count(n, DEFAULT_PARAMS.scalar_bytes, limit)) return false;
    v.resize(n);
    uint8_t b[32];
    for (auto& s : v) {
        if (!r.get_raw(b, 32)) return false;
        s = sc_from_bytes(b);
        if (!sc_is_canonical(s)) return false;
    }
    return true;
}

inline bool get_points(ByteReader& r, std::vector<Commitment>& v, size_t limit) {
    uint64_t n = 0;
    if (!r.get_count(n, DEFAULT_PARAMS.point_bytes, limit)) return false;
    v.resize(n);
    // group membership is checked by whoever decodes the points
    for (auto& p : v)
        if (!r.get_array(p)) return false;
    return true;
}

}

inline Bytes serialize_commitments(const std::vector<Commitment>& commitments) {
    ByteWriter w;
    w.reserve(8 + commitments.size() * 32);
    detail::put_points(w, commitments);
    return w.take();
}

inline Bytes serialize_packet(const Packet& p) {
    ByteWriter w;
    w.reserve(24 + 32 * (p.coding_vector.size() + p.payload.size() + p.commitments.size()));
    detail::put_scalars(w, p.coding_vector);
    detail::put_scalars(w, p.payload);
    detail::put_points(w, p.commitments);
    return w.take();
}

inline Status parse_packet(const uint8_t* data, size_t len, Packet& out) {
    ByteReader r(data, len);
    Packet p;
    if (!detail::get_scalars(r, p.coding_vector, DEFAULT_PARAMS.max_num_chunks)) return Status::InvalidMessage;
    if (!detail::get_scalars(r, p.payload, DEFAULT_PARAMS.max_chunk_scalars)) return Status::InvalidMessage;
    if (!detail::get_points(r, p.commitments, DEFAULT_PARAMS.max_num_chunks)) return Status::InvalidMessage;
    if (!r.done()) return Status::InvalidMessage;
    out = std::move(p);
    return Status::Ok;
}

inline Status parse_packet(const Bytes& data, Packet& out) {
    return parse_packet(data.data(), data.size(), out);
}

inline bool commitments_hash(const std::vector<Commitment>& commitments, Digest& out) {
    Bytes canon = serialize_commitments(commitments);
    return sha256_bytes(canon.data(), canon.size(), out.data());
}

inline Status packet_commitments_hash(const uint8_t* data, size_t len, Digest& out) {
    Packet p;
    Status st = parse_packet(data, len, p);
    if (!ok(st)) return st;
    if (!commitments_hash(p.commitments, out)) return Status::CryptoFailure;
    return Status::Ok;
}

// sum_i weights[i] * packets[i]; all packets must share one commitment set and shape
inline Status combine_packets(const std::vector<const Packet*>& packets,
                              const std::vector<Scalar>& weights,
                              Packet& out) {
    if (packets.empty() || packets.size() != weights.size()) return Status::SizeMismatch;

    const Packet& first = *packets[0];
    Packet acc;
    acc.coding_vector.assign(first.coding_vector.size(), sc_zero());
    acc.payload.assign(first.payload.size(), sc_zero());
    acc.commitments = first.commitments;

    for (size_t i = 0; i < packets.size(); i++) {
        const Packet& p = *packets[i];
        if (p.commitments != first.commitments) return Status::CommitmentsMismatch;
        if (p.coding_vector.size() != acc.coding_vector.size() ||
            p.payload.size() != acc.payload.size())
            return Status::SizeMismatch;

        const Scalar& c = weights[i];
        for (size_t k = 0; k < acc.coding_vector.size(); k++)
            acc.coding_vector[k] = sc_muladd(acc.coding_vector[k], c, p.coding_vector[k]);
        for (size_t j = 0; j < acc.payload.size(); j++)
            acc.payload[j] = sc_muladd(acc.payload[j], c, p.payload[j]);
    }

    out = std::move(acc);
    return Status::Ok;
}

}
