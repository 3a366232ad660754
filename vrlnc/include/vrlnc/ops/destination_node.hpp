#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "../coding/chunk_codec.hpp"
#include "../coding/committer.hpp"
#include "../coding/echelon.hpp"
#include "../coding/packet.hpp"
#include "../core/bytes.hpp"
#include "../core/random.hpp"
#include "../core/types.hpp"
#include "../crypto/commitment.hpp"
#include "../crypto/scalar.hpp"
#include "../utils/log.hpp"

namespace vrlnc {

class DestinationNode {
    Committer committer_;
    size_t num_chunks_ = 0;
    size_t chunk_size_ = 0;
    Echelon echelon_;

    bool has_reference_ = false;
    std::vector<Commitment> reference_;
    std::vector<ExtPoint> reference_points_;

    Status recode(const std::vector<Scalar>& weights, Packet& out) const {
        Packet p;
        p.coding_vector.assign(num_chunks_, sc_zero());
        p.payload.assign(committer_.len(), sc_zero());
        const auto& rows = echelon_.rows();
        for (size_t i = 0; i < rows.size(); i++) {
            const Scalar& c = weights[i];
            for (size_t k = 0; k < num_chunks_; k++)
                p.coding_vector[k] = sc_muladd(p.coding_vector[k], c, rows[i].coeffs[k]);
            for (size_t j = 0; j < p.payload.size(); j++)
                p.payload[j] = sc_muladd(p.payload[j], c, rows[i].payload[j]);
        }
        p.commitments = reference_;
        out = std::move(p);
        return Status::Ok;
    }

public:
    DestinationNode() = default;

    // chunk_size is the original byte length of one chunk
    Status init(const Committer& committer, size_t num_chunks, size_t chunk_size) {
        if (!committer.ready()) return Status::NotReady;
        if (num_chunks == 0 || num_chunks > DEFAULT_PARAMS.max_num_chunks) return Status::SizeMismatch;
        if (chunk_size == 0 || scalars_for_chunk(chunk_size) > committer.len()) return Status::SizeMismatch;

        committer_ = committer;
        num_chunks_ = num_chunks;
        chunk_size_ = chunk_size;
        echelon_.init(num_chunks);
        has_reference_ = false;
        reference_.clear();
        reference_points_.clear();
        return Status::Ok;
    }

    bool ready() const { return num_chunks_ > 0; }
    bool is_full() const { return echelon_.is_full(); }
    size_t rank() const { return echelon_.rank(); }
    size_t num_chunks() const { return num_chunks_; }
    size_t chunk_size() const { return chunk_size_; }
    const Committer& committer() const { return committer_; }

    // empty until the first packet is accepted
    const std::vector<Commitment>& commitments() const { return reference_; }

    Status receive(const Packet& p) {
        if (!ready()) return Status::NotReady;
        if (p.coding_vector.size() != num_chunks_ || p.payload.size() != committer_.len())
            return Status::InvalidMessage;

        std::vector<ExtPoint> fresh;
        if (has_reference_) {
            if (p.commitments != reference_) {
                logger()->warn("destination: packet from another session");
                return Status::CommitmentsMismatch;
            }
        } else {
            if (p.commitments.size() != num_chunks_) return Status::ChunkCountMismatch;
            if (!decode_commitments(fresh, p.commitments)) return Status::InvalidMessage;
        }

        // every packet is verified, including ones that would not raise the rank
        Commitment claimed;
        Status st = committer_.commit(p.payload, claimed);
        if (!ok(st)) return st;
        const auto& pts = has_reference_ ? reference_points_ : fresh;
        if (!verify_linear_combination(p.coding_vector, pts, claimed)) {
            logger()->warn("destination: payload does not match its commitments");
            return Status::VerificationFailed;
        }

        st = echelon_.insert(p.coding_vector, p.payload);
        if (st == Status::LinearlyDependentChunk)
            logger()->debug("destination: dependent packet dropped at rank {}", rank());
        if (!ok(st)) return st;

        if (!has_reference_) {
            reference_ = p.commitments;
            reference_points_ = std::move(fresh);
            has_reference_ = true;
        }

        logger()->debug("destination: accepted packet, rank {}/{}", rank(), num_chunks_);
        if (is_full()) logger()->info("destination: full rank {}, ready to decode", num_chunks_);
        return Status::Ok;
    }

    Status receive_chunk(const uint8_t* data, size_t len) {
        if (!ready()) return Status::NotReady;
        Packet p;
        Status st = parse_packet(data, len, p);
        if (!ok(st)) {
            logger()->debug("destination: unparseable packet of {} bytes", len);
            return st;
        }
        return receive(p);
    }

    Status receive_chunk(const Bytes& data) {
        return receive_chunk(data.data(), data.size());
    }

    // original block, num_chunks * chunk_size bytes
    Status decode(Bytes& out) const {
        if (!is_full()) return Status::NotReady;
        Bytes block;
        block.reserve(num_chunks_ * chunk_size_);
        for (size_t k = 0; k < num_chunks_; k++) {
            const Chunk* payload = echelon_.payload_for(k);
            if (!payload) return Status::NotReady;
            Status st = unpack_chunk(*payload, chunk_size_, block);
            if (!ok(st)) return st;
        }
        out = std::move(block);
        return Status::Ok;
    }

    // fresh combination of the accepted rows for relaying downstream
    Status chunk_to_send(Packet& out) const {
        if (rank() == 0) return Status::NothingToSend;
        std::vector<Scalar> weights;
        if (!sc_random_vec(weights, rank())) {
            logger()->error("destination: csprng unavailable");
            return Status::CryptoFailure;
        }
        return recode(weights, out);
    }

    Status chunk_to_send(SeedableRng& rng, Packet& out) const {
        if (rank() == 0) return Status::NothingToSend;
        if (!rng.ready()) return Status::CryptoFailure;
        std::vector<Scalar> weights = sc_random_vec(rank(), rng);
        if (!rng.ready()) return Status::CryptoFailure;
        return recode(weights, out);
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
