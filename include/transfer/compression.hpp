#pragma once

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nocturne::transfer {

/**
 * @brief gzip-wrapped deflate compression (zlib)
 *
 * @throws std::runtime_error when zlib reports an error
 */
std::vector<uint8_t> gzipCompress(const std::vector<uint8_t>& data, int level = 6);

/**
 * @brief Inflates a gzip or zlib stream
 *
 * Returns nullopt on a corrupt or truncated stream, or when the output
 * would exceed maxOutput bytes.
 */
std::optional<std::vector<uint8_t>> gzipDecompress(const std::vector<uint8_t>& data,
                                                   size_t maxOutput = 16 * 1024 * 1024);

} // namespace nocturne::transfer
