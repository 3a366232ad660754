#pragma once

#include <cstdint>
#include <cstring>
#include <algorithm>
#include <utility>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "hash.hpp"
#include "types.hpp"

namespace vrlnc {

inline bool csprng_bytes(uint8_t* out, size_t len) {
    return RAND_bytes(out, (int)len) == 1;
}

// deterministic AES-256-CTR keystream, only for callers that ask for reproducible mixes
class SeedableRng {
    EVP_CIPHER_CTX* ctx_ = nullptr;
    uint8_t buf_[64] = {};
    size_t pos_ = sizeof(buf_);
    bool failed_ = false;

    // a failed update leaves zeros and clears ready()
    void refill() {
        static const uint8_t zeros[64] = {};
        int outl = 0;
        if (!ctx_ || EVP_EncryptUpdate(ctx_, buf_, &outl, zeros, (int)sizeof(zeros)) != 1 ||
            outl != (int)sizeof(buf_)) {
            memset(buf_, 0, sizeof(buf_));
            failed_ = true;
        }
        pos_ = 0;
    }

public:
    SeedableRng() = default;
    SeedableRng(const SeedableRng&) = delete;
    SeedableRng& operator=(const SeedableRng&) = delete;

    SeedableRng(SeedableRng&& o) noexcept : ctx_(o.ctx_), pos_(o.pos_), failed_(o.failed_) {
        memcpy(buf_, o.buf_, sizeof(buf_));
        o.ctx_ = nullptr;
    }

    SeedableRng& operator=(SeedableRng&& o) noexcept {
        std::swap(ctx_, o.ctx_);
        std::swap(buf_, o.buf_);
        std::swap(pos_, o.pos_);
        std::swap(failed_, o.failed_);
        return *this;
    }

    ~SeedableRng() {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
    }

    bool init(const uint8_t seed[32]) {
        if (!ctx_) ctx_ = EVP_CIPHER_CTX_new();
        if (!ctx_) return false;
        uint8_t iv[16] = {};
        if (EVP_EncryptInit_ex(ctx_, EVP_aes_256_ctr(), nullptr, seed, iv) != 1) {
            EVP_CIPHER_CTX_free(ctx_);
            ctx_ = nullptr;
            return false;
        }
        pos_ = sizeof(buf_);
        failed_ = false;
        return true;
    }

    bool ready() const { return ctx_ != nullptr && !failed_; }

    void fill(uint8_t* out, size_t len) {
        while (len > 0) {
            if (pos_ == sizeof(buf_)) refill();
            size_t n = std::min(len, sizeof(buf_) - pos_);
            memcpy(out, buf_ + pos_, n);
            pos_ += n;
            out += n;
            len -= n;
        }
    }

    uint64_t u64() {
        uint8_t b[8];
        fill(b, 8);
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) v |= (uint64_t)b[i] << (i * 8);
        return v;
    }
};

// rng.ready() is false when the cipher could not be set up
inline SeedableRng make_seeded_rng(const uint8_t seed[32]) {
    SeedableRng rng;
    if (!rng.init(seed)) return SeedableRng{};
    return rng;
}

inline bool derive_seed(const char* label, uint64_t index, uint8_t seed[32]) {
    Sha256 h;
    return h.init()
        && h.update(Dom::RNG_SEED)
        && h.update(label)
        && sha256_acc_u64(h, index)
        && h.finish(seed);
}

}
