#include "rubikpow/Digest.h"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace rubikpow {

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

Digest sha3_256(const uint8_t* data, size_t length) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("SHA3-256 initialization failed");
    }
    if (length > 0 && EVP_DigestUpdate(ctx.get(), data, length) != 1) {
        throw std::runtime_error("SHA3-256 update failed");
    }

    Digest out{};
    unsigned int outLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &outLength) != 1 || outLength != out.size()) {
        throw std::runtime_error("SHA3-256 finalization failed");
    }
    return out;
}

Digest sha3_256(const std::vector<uint8_t>& data) {
    return sha3_256(data.data(), data.size());
}

std::string digestToHex(const Digest& digest) {
    static const char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        hex += hexDigits[byte >> 4];
        hex += hexDigits[byte & 0x0F];
    }
    return hex;
}

} // namespace rubikpow
