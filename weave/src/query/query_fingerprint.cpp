#include "query/query_fingerprint.hpp"

#include <openssl/evp.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace weave::query {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

uint64_t load_be64(const unsigned char* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

} // namespace

std::string Fingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    char buf[33];
    uint64_t vals[2] = {high, low};
    for (int v = 0; v < 2; ++v) {
        uint64_t val = vals[v];
        for (int i = 15; i >= 0; --i) {
            buf[v * 16 + i] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    buf[32] = '\0';
    return std::string(buf);
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("fingerprint: EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        (len > 0 && EVP_DigestUpdate(ctx.get(), data, len) != 1) ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1 || digest_len < 16) {
        throw std::runtime_error("fingerprint: SHA-256 digest failed");
    }

    return {load_be64(digest), load_be64(digest + 8)};
}

Fingerprint fingerprint_string(const std::string& str) {
    return fingerprint_bytes(str.data(), str.size());
}

Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b) {
    unsigned char buf[32];
    uint64_t vals[4] = {a.high, a.low, b.high, b.low};
    for (int v = 0; v < 4; ++v) {
        for (int i = 0; i < 8; ++i) {
            buf[v * 8 + i] = static_cast<unsigned char>(vals[v] >> (56 - 8 * i));
        }
    }
    return fingerprint_bytes(buf, sizeof(buf));
}

Fingerprint fingerprint_content(const fs::FileContent& content) {
    // Tag byte keeps a missing file distinct from an empty one
    std::string tagged;
    tagged.reserve(content.bytes.size() + 1);
    tagged += content.exists ? '1' : '0';
    tagged += content.bytes;
    return fingerprint_string(tagged);
}

} // namespace weave::query
