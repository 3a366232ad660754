#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <openssl/evp.h>

namespace vrlnc {

using Digest = std::array<uint8_t, 32>;

class Sha256 {
    EVP_MD_CTX* ctx_ = nullptr;

public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {}
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    ~Sha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    bool init() {
        return ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
    }

    bool update(const uint8_t* data, size_t len) {
        if (len == 0) return true;
        return EVP_DigestUpdate(ctx_, data, len) == 1;
    }

    bool update(const char* s) {
        return update(reinterpret_cast<const uint8_t*>(s), strlen(s));
    }

    bool finish(uint8_t out[32]) {
        unsigned int n = 0;
        return EVP_DigestFinal_ex(ctx_, out, &n) == 1 && n == 32;
    }
};

inline bool sha256_acc_u64(Sha256& h, uint64_t v) {
    uint8_t b[8];
    for (int i = 0; i < 8; i++) b[i] = (uint8_t)(v >> (i * 8));
    return h.update(b, 8);
}

inline bool sha256_bytes(const void* data, size_t len, uint8_t out[32]) {
    Sha256 h;
    return h.init()
        && h.update(static_cast<const uint8_t*>(data), len)
        && h.finish(out);
}

}
