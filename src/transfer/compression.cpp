#include "transfer/compression.hpp"
#include "system/logger.hpp"

#include <zlib.h>

#include <stdexcept>
#include <string>

namespace nocturne::transfer {

namespace {

constexpr int GZIP_WINDOW_BITS = 15 + 16;     // gzip wrapper
constexpr int AUTO_DETECT_WINDOW_BITS = 15 + 32;
constexpr size_t CHUNK = 16 * 1024;

} // namespace

std::vector<uint8_t> gzipCompress(const std::vector<uint8_t>& data, int level) {
    z_stream stream{};
    int result = deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (result != Z_OK) {
        throw std::runtime_error("deflateInit2 failed with error " + std::to_string(result));
    }

    std::vector<uint8_t> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = compressed.data();
    stream.avail_out = static_cast<uInt>(compressed.size());

    result = deflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    deflateEnd(&stream);

    if (result != Z_STREAM_END) {
        throw std::runtime_error("deflate failed with error " + std::to_string(result));
    }

    compressed.resize(produced);
    Logger::debug("Compression: {} -> {} bytes", data.size(), produced);
    return compressed;
}

std::optional<std::vector<uint8_t>> gzipDecompress(const std::vector<uint8_t>& data, size_t maxOutput) {
    if (data.empty()) {
        return std::nullopt;
    }

    z_stream stream{};
    if (inflateInit2(&stream, AUTO_DETECT_WINDOW_BITS) != Z_OK) {
        Logger::error("Compression: inflateInit2 failed");
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> output;
    uint8_t buffer[CHUNK];
    int result = Z_OK;

    do {
        stream.next_out = buffer;
        stream.avail_out = static_cast<uInt>(sizeof(buffer));

        result = inflate(&stream, Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END) {
            Logger::warning("Compression: inflate failed with error {}", result);
            inflateEnd(&stream);
            return std::nullopt;
        }

        size_t produced = sizeof(buffer) - stream.avail_out;
        if (output.size() + produced > maxOutput) {
            Logger::warning("Compression: inflated data exceeds limit of {} bytes", maxOutput);
            inflateEnd(&stream);
            return std::nullopt;
        }
        output.insert(output.end(), buffer, buffer + produced);

        if (result == Z_OK && stream.avail_in == 0 && produced == 0) {
            // input exhausted before the end of the stream
            Logger::warning("Compression: truncated compressed stream");
            inflateEnd(&stream);
            return std::nullopt;
        }
    } while (result != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

} // namespace nocturne::transfer
