#include "askills/platform.hpp"

#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace askills {

// ============================================================================
// SHA-256 digests for manifest checksums
// ============================================================================

namespace {

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

std::string to_hex(const unsigned char* bytes, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string hex(static_cast<size_t>(len) * 2, '0');
    for (unsigned int i = 0; i < len; ++i) {
        hex[2 * i] = digits[bytes[i] >> 4];
        hex[2 * i + 1] = digits[bytes[i] & 0x0F];
    }
    return hex;
}

// Streams chunks into one SHA-256 context; the first failure sticks
class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            error_ = "cannot allocate digest context";
        } else if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error_ = "sha256 init failed";
        }
    }

    void feed(const void* data, size_t len) {
        if (!error_.empty()) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) error_ = "sha256 update failed";
    }

    HashResult finish() {
        HashResult result;
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1) {
            result.error = "sha256 final failed";
            return result;
        }
        result.hex_digest = to_hex(md, md_len);
        result.ok = true;
        return result;
    }

private:
    MdCtxPtr ctx_;
    std::string error_;
};

} // namespace

HashResult compute_sha256(const std::string& data) {
    Sha256Stream sha;
    sha.feed(data.data(), data.size());
    return sha.finish();
}

HashResult compute_sha256_file(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        HashResult result;
        result.error = "cannot open " + file_path;
        return result;
    }

    Sha256Stream sha;
    char chunk[16384];
    while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
        sha.feed(chunk, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        HashResult result;
        result.error = "read failed: " + file_path;
        return result;
    }
    return sha.finish();
}

std::string digest_ref(const std::string& data) {
    auto hash = compute_sha256(data);
    return hash.ok ? "sha256:" + hash.hex_digest : std::string();
}

} // namespace askills
