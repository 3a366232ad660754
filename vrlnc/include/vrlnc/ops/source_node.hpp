#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "../coding/chunk_codec.hpp"
#include "../coding/committer.hpp"
#include "../coding/packet.hpp"
#include "../core/bytes.hpp"
#include "../core/random.hpp"
#include "../core/types.hpp"
#include "../crypto/scalar.hpp"
#include "../utils/log.hpp"

namespace vrlnc {

class SourceNode {
    Committer committer_;
    size_t chunk_size_ = 0;
    std::vector<Chunk> chunks_;
    std::vector<Commitment> commitments_;

public:
    SourceNode() = default;

    Status init(const Committer& committer, const uint8_t* block, size_t len, size_t num_chunks) {
        if (!committer.ready()) return Status::NotReady;
        if (num_chunks > DEFAULT_PARAMS.max_num_chunks) return Status::SizeMismatch;

        size_t chunk_size = 0;
        Status st = split_block(len, num_chunks, chunk_size);
        if (!ok(st)) return st;

        std::vector<Chunk> chunks(num_chunks);
        std::vector<Commitment> commitments(num_chunks);
        for (size_t k = 0; k < num_chunks; k++) {
            st = pack_chunk(block + k * chunk_size, chunk_size, committer.len(), chunks[k]);
            if (!ok(st)) return st;
            st = committer.commit(chunks[k], commitments[k]);
            if (!ok(st)) return st;
        }

        committer_ = committer;
        chunk_size_ = chunk_size;
        chunks_ = std::move(chunks);
        commitments_ = std::move(commitments);
        logger()->debug("source: {} chunks of {} bytes, {} scalars each",
                        num_chunks, chunk_size, committer_.len());
        return Status::Ok;
    }

    Status init(const Committer& committer, const Bytes& block, size_t num_chunks) {
        return init(committer, block.data(), block.size(), num_chunks);
    }

    bool ready() const { return !chunks_.empty(); }
    size_t num_chunks() const { return chunks_.size(); }
    size_t chunk_size() const { return chunk_size_; }
    const Committer& committer() const { return committer_; }
    const std::vector<Chunk>& chunks() const { return chunks_; }
    const std::vector<Commitment>& commitments() const { return commitments_; }

    Status chunk_with_coefficients(const std::vector<Scalar>& coeffs, Packet& out) const {
        if (!ready()) return Status::NotReady;
        if (coeffs.size() != chunks_.size()) return Status::SizeMismatch;

        Packet p;
        p.coding_vector = coeffs;
        p.payload.assign(committer_.len(), sc_zero());
        for (size_t k = 0; k < chunks_.size(); k++) {
            const Scalar& c = coeffs[k];
            if (sc_is_zero(c)) continue;
            const Chunk& ch = chunks_[k];
            for (size_t j = 0; j < p.payload.size(); j++)
                p.payload[j] = sc_muladd(p.payload[j], c, ch[j]);
        }
        p.commitments = commitments_;
        out = std::move(p);
        return Status::Ok;
    }

    Status chunk_to_send(Packet& out) const {
        if (!ready()) return Status::NotReady;
        std::vector<Scalar> coeffs;
        if (!sc_random_vec(coeffs, chunks_.size())) {
            logger()->error("source: csprng unavailable");
            return Status::CryptoFailure;
        }
        return chunk_with_coefficients(coeffs, out);
    }

    Status chunk_to_send(SeedableRng& rng, Packet& out) const {
        if (!ready()) return Status::NotReady;
        if (!rng.ready()) return Status::CryptoFailure;
        std::vector<Scalar> coeffs = sc_random_vec(chunks_.size(), rng);
        if (!rng.ready()) return Status::CryptoFailure;
        return chunk_with_coefficients(coeffs, out);
    }

    Status chunk_to_send(Bytes& out) const {
        Packet p;
        Status st = chunk_to_send(p);
        if (!ok(st)) return st;
        out = serialize_packet(p);
        return Status::Ok;
    }
};

}
