#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

#include "link_types.hpp"

namespace nocturne::transfer {

/**
 * @brief 32-byte cryptographic digest via OpenSSL EVP
 *
 * @throws std::runtime_error if the EVP context cannot be driven
 */
Digest computeDigest(DigestAlgorithm algorithm, const uint8_t* data, size_t size);
Digest computeDigest(DigestAlgorithm algorithm, const std::vector<uint8_t>& data);

std::string toHex(const Digest& digest);

} // namespace nocturne::transfer
