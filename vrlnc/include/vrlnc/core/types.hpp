#pragma once

#include <cstddef>
#include <cstdint>

namespace vrlnc {

// domain separation tags, changing any of them changes every commitment
namespace Dom {
    inline constexpr const char* GENERATORS = "vrlnc.dom.generators";
    inline constexpr const char* RNG_SEED = "vrlnc.dom.rng_seed";
}

// geometry and parser limits
struct Params {

    // 2^252 < l, so a 252-bit word is always a canonical scalar
    size_t bits_per_scalar = 252;

    size_t scalar_bytes = 32;
    size_t point_bytes = 32;

    // upper bounds accepted from the wire before anything is allocated
    size_t max_chunk_scalars = 1u << 20;
    size_t max_num_chunks = 1u << 16;

    uint8_t committer_version = 1;
};

inline constexpr Params DEFAULT_PARAMS{};

enum class Status : int {
    Ok = 0,
    InvalidMessage = -1,
    CommitmentsMismatch = -2,
    ChunkCountMismatch = -3,
    VerificationFailed = -4,
    LinearlyDependentChunk = -5,
    SizeMismatch = -6,
    NotReady = -7,
    NothingToSend = -8,
    CryptoFailure = -9
};

inline const char* status_str(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::InvalidMessage: return "invalid message";
        case Status::CommitmentsMismatch: return "commitments mismatch";
        case Status::ChunkCountMismatch: return "chunk count mismatch";
        case Status::VerificationFailed: return "verification failed";
        case Status::LinearlyDependentChunk: return "linearly dependent chunk";
        case Status::SizeMismatch: return "size mismatch";
        case Status::NotReady: return "not ready";
        case Status::NothingToSend: return "nothing to send";
        case Status::CryptoFailure: return "crypto backend failure";
    }
    return "unknown";
}

inline bool ok(Status s) { return s == Status::Ok; }

}
