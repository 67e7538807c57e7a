#include "transfer/digest.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace nocturne::transfer {

namespace {

const EVP_MD* digestFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return EVP_sha256();
        case DigestAlgorithm::Sha3_256: return EVP_sha3_256();
        case DigestAlgorithm::Blake2s256: return EVP_blake2s256();
    }
    return EVP_sha256();
}

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

} // namespace

Digest computeDigest(DigestAlgorithm algorithm, const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdContextDeleter> context(EVP_MD_CTX_new());
    if (!context) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    const EVP_MD* md = digestFor(algorithm);
    if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (size > 0 && EVP_DigestUpdate(context.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned char output[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), output, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    if (length != Digest().size()) {
        throw std::runtime_error("digest length is not 32 bytes");
    }

    Digest digest{};
    std::copy(output, output + length, digest.begin());
    return digest;
}

Digest computeDigest(DigestAlgorithm algorithm, const std::vector<uint8_t>& data) {
    return computeDigest(algorithm, data.data(), data.size());
}

std::string toHex(const Digest& digest) {
    static const char* hexDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        hex.push_back(hexDigits[byte >> 4]);
        hex.push_back(hexDigits[byte & 0x0F]);
    }
    return hex;
}

} // namespace nocturne::transfer
