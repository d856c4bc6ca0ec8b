// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <crypto/sha3.h>

#include <openssl/evp.h>
#include <openssl/err.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string LastOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

} // namespace

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_256: hash output buffer is NULL");
    }

    std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("SHA3_256: EVP_MD_CTX_new failed");
    }

    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &out_len) != 1 ||
        out_len != 32) {
        throw std::runtime_error("SHA3_256: " + LastOpenSSLError());
    }
}
