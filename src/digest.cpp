#include "ferry/digest.h"
#include "ferry/error.h"

#include <blake3.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <xxhash.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace ferry {

namespace {

// ---------------------------------------------------------------------------
// XXH3 (128-bit)
// ---------------------------------------------------------------------------

class XxHasher : public Hasher {
public:
    XxHasher() : state_(XXH3_createState()) {
        if (!state_ || XXH3_128bits_reset(state_) == XXH_ERROR) {
            XXH3_freeState(state_);
            throw FerryError(ErrorKind::Filesystem, "xxhash: cannot initialise state");
        }
    }
    ~XxHasher() override { XXH3_freeState(state_); }

    XxHasher(const XxHasher&) = delete;
    XxHasher& operator=(const XxHasher&) = delete;

    void update(const uint8_t* data, size_t len) override {
        if (XXH3_128bits_update(state_, data, len) == XXH_ERROR)
            throw FerryError(ErrorKind::Filesystem, "xxhash: update failed");
    }

    Digest finish() override {
        XXH128_canonical_t canon;
        XXH128_canonicalFromHash(&canon, XXH3_128bits_digest(state_));
        Digest d;
        d.algorithm = HashAlgorithm::XxHash;
        d.bytes.assign(canon.digest, canon.digest + sizeof(canon.digest));
        return d;
    }

private:
    XXH3_state_t* state_;
};

// ---------------------------------------------------------------------------
// BLAKE3
// ---------------------------------------------------------------------------

class Blake3Hasher : public Hasher {
public:
    Blake3Hasher() { blake3_hasher_init(&hasher_); }

    void update(const uint8_t* data, size_t len) override {
        blake3_hasher_update(&hasher_, data, len);
    }

    Digest finish() override {
        Digest d;
        d.algorithm = HashAlgorithm::Blake3;
        d.bytes.resize(BLAKE3_OUT_LEN);
        blake3_hasher_finalize(&hasher_, d.bytes.data(), BLAKE3_OUT_LEN);
        return d;
    }

private:
    blake3_hasher hasher_;
};

// ---------------------------------------------------------------------------
// OpenSSL EVP (md5, sha256, sha512)
// ---------------------------------------------------------------------------

[[noreturn]] void throw_openssl(const std::string& ctx) {
    unsigned long code = ERR_get_error();
    std::string msg = "openssl: " + ctx;
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    throw FerryError(ErrorKind::Filesystem, msg);
}

class EvpHasher : public Hasher {
public:
    EvpHasher(HashAlgorithm algo, const EVP_MD* md)
        : algo_(algo), ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) throw_openssl("EVP_MD_CTX_new");
        if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw_openssl("EVP_DigestInit_ex");
        }
    }
    ~EvpHasher() override { EVP_MD_CTX_free(ctx_); }

    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;

    void update(const uint8_t* data, size_t len) override {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) throw_openssl("EVP_DigestUpdate");
    }

    Digest finish() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &len) != 1) throw_openssl("EVP_DigestFinal_ex");
        Digest d;
        d.algorithm = algo_;
        d.bytes.assign(out, out + len);
        return d;
    }

private:
    HashAlgorithm algo_;
    EVP_MD_CTX*   ctx_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Hasher factory
// ---------------------------------------------------------------------------

std::unique_ptr<Hasher> Hasher::create(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::XxHash: return std::make_unique<XxHasher>();
        case HashAlgorithm::Blake3: return std::make_unique<Blake3Hasher>();
        case HashAlgorithm::Md5:    return std::make_unique<EvpHasher>(algo, EVP_md5());
        case HashAlgorithm::Sha256: return std::make_unique<EvpHasher>(algo, EVP_sha256());
        case HashAlgorithm::Sha512: return std::make_unique<EvpHasher>(algo, EVP_sha512());
    }
    throw ValidationError("unsupported hash algorithm");
}

size_t digest_size(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::XxHash: return 16;
        case HashAlgorithm::Blake3: return BLAKE3_OUT_LEN;
        case HashAlgorithm::Md5:    return 16;
        case HashAlgorithm::Sha256: return 32;
        case HashAlgorithm::Sha512: return 64;
    }
    return 0;
}

// ---------------------------------------------------------------------------
// fingerprint
// ---------------------------------------------------------------------------

Digest fingerprint(const std::filesystem::path& path,
                   HashAlgorithm algo,
                   size_t chunk_size) {
    if (chunk_size == 0) throw ValidationError("chunk size must be greater than zero");

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FilesystemError(path.string(),
                              std::string("cannot open for reading: ") + std::strerror(errno));
    }

    auto hasher = Hasher::create(algo);
    std::vector<char> buffer(chunk_size);
    while (ifs) {
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = ifs.gcount();
        if (got > 0) {
            hasher->update(reinterpret_cast<const uint8_t*>(buffer.data()),
                           static_cast<size_t>(got));
        }
    }
    if (ifs.bad()) {
        throw FilesystemError(path.string(), "read error");
    }
    return hasher->finish();
}

Digest fingerprint_bytes(const void* data, size_t len, HashAlgorithm algo) {
    auto hasher = Hasher::create(algo);
    hasher->update(static_cast<const uint8_t*>(data), len);
    return hasher->finish();
}

} // namespace ferry
