#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "../core/bytes.hpp"
#include "../core/types.hpp"
#include "../crypto/commitment.hpp"
#include "../crypto/generators.hpp"
#include "../utils/log.hpp"
#include "chunk_codec.hpp"

namespace vrlnc {

class Committer {
    GeneratorBasis basis_;

    enum : uint8_t { FLAG_EXPLICIT_BASIS = 1 };

public:
    Committer() = default;

    // m scalars per chunk
    Status init(size_t m) {
        if (m == 0 || m > DEFAULT_PARAMS.max_chunk_scalars) return Status::SizeMismatch;
        GeneratorBasis b;
        if (!derive_basis(b, m)) return Status::CryptoFailure;
        basis_ = std::move(b);
        logger()->debug("committer: derived {} generators", m);
        return Status::Ok;
    }

    Status init_for_message(size_t message_size, size_t num_chunks) {
        size_t chunk_size = 0;
        Status st = split_block(message_size, num_chunks, chunk_size);
        if (!ok(st)) return st;
        return init(scalars_for_chunk(chunk_size));
    }

    bool ready() const { return basis_.size() > 0; }
    size_t len() const { return basis_.size(); }
    const GeneratorBasis& basis() const { return basis_; }
    const std::vector<RistrettoPoint>& generators() const { return basis_.encoded; }

    Status commit(const Chunk& chunk, Commitment& out) const {
        return vrlnc::commit(basis_, chunk, out);
    }

    Bytes serialize(bool with_basis = false) const {
        ByteWriter w;
        w.reserve(10 + (with_basis ? 32 * basis_.size() : 0));
        w.put_u8(DEFAULT_PARAMS.committer_version);
        w.put_u8(with_basis ? FLAG_EXPLICIT_BASIS : 0);
        w.put_u64(basis_.size());
        if (with_basis)
            for (const auto& g : basis_.encoded) w.put_array(g);
        return w.take();
    }

    Status deserialize(const uint8_t* data, size_t len) {
        ByteReader r(data, len);
        uint8_t version = 0, flags = 0;
        uint64_t m = 0;
        if (!r.get_u8(version) || version != DEFAULT_PARAMS.committer_version) return Status::InvalidMessage;
        if (!r.get_u8(flags) || (flags & ~FLAG_EXPLICIT_BASIS)) return Status::InvalidMessage;
        if (!r.get_u64(m) || m == 0 || m > DEFAULT_PARAMS.max_chunk_scalars) return Status::InvalidMessage;

        if (!(flags & FLAG_EXPLICIT_BASIS)) {
            if (!r.done()) return Status::InvalidMessage;
            return init((size_t)m);
        }

        if (r.remaining() != m * DEFAULT_PARAMS.point_bytes) return Status::InvalidMessage;
        std::vector<RistrettoPoint> encoded(m);
        for (auto& g : encoded)
            if (!r.get_array(g)) return Status::InvalidMessage;

        GeneratorBasis b;
        if (!basis_from_encoded(b, std::move(encoded))) return Status::InvalidMessage;
        basis_ = std::move(b);
        return Status::Ok;
    }

    Status deserialize(const Bytes& data) {
        return deserialize(data.data(), data.size());
    }
};

}
