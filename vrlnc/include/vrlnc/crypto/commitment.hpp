#pragma once

#include <cstdint>
#include <vector>

#include "../core/types.hpp"
#include "generators.hpp"
#include "msm.hpp"
#include "ristretto255.hpp"

namespace vrlnc {

using Commitment = RistrettoPoint;
using Chunk = std::vector<Scalar>;

// C = sum_j chunk[j] * G[j]; a chunk shorter than the basis uses its prefix
inline Status commit(const GeneratorBasis& basis, const Chunk& chunk, Commitment& out) {
    if (chunk.size() > basis.size()) return Status::SizeMismatch;
    out = rist_encode(multi_scalar_mul(chunk.data(), basis.points.data(), chunk.size()));
    return Status::Ok;
}

inline bool decode_commitments(std::vector<ExtPoint>& out, const std::vector<Commitment>& commitments) {
    out.resize(commitments.size());
    for (size_t k = 0; k < commitments.size(); k++)
        if (!rist_decode(out[k], commitments[k])) return false;
    return true;
}

inline bool verify_linear_combination(
    const std::vector<Scalar>& coding_vector,
    const std::vector<ExtPoint>& reference,
    const Commitment& claimed
) {
    if (coding_vector.size() != reference.size()) return false;
    return rist_encode(multi_scalar_mul(coding_vector, reference)) == claimed;
}

// sum_k coding_vector[k] * reference[k] == claimed
inline bool verify_linear_combination(
    const std::vector<Scalar>& coding_vector,
    const std::vector<Commitment>& reference,
    const Commitment& claimed
) {
    std::vector<ExtPoint> pts;
    if (!decode_commitments(pts, reference)) return false;
    return verify_linear_combination(coding_vector, pts, claimed);
}

}
