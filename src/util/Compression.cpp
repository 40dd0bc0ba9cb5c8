#include "util/Compression.hpp"

#include <stdexcept>

#include <zlib.h>

namespace gitcl {

std::vector<uint8_t> zlibCompress(const std::string& data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw std::runtime_error("zlib deflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(data.size());
    // Some zlib versions have non-const next_in
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

    std::vector<uint8_t> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.avail_out = static_cast<uInt>(compressed.size());
    stream.next_out = compressed.data();

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw std::runtime_error("zlib deflate failed");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

std::string zlibDecompress(const std::vector<uint8_t>& compressed) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_in = const_cast<Bytef*>(compressed.data());

    std::string decompressed;
    std::vector<uint8_t> buffer(16384);

    int ret;
    do {
        stream.avail_out = static_cast<uInt>(buffer.size());
        stream.next_out = buffer.data();

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib inflate failed");
        }
        // Truncated input: no progress possible and no end of stream
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw std::runtime_error("zlib stream truncated");
        }

        size_t have = buffer.size() - stream.avail_out;
        decompressed.append(reinterpret_cast<char*>(buffer.data()), have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return decompressed;
}

std::string zlibInflateEmbedded(const uint8_t* data, size_t available, size_t expectedSize, size_t& consumed) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }
    stream.avail_in = static_cast<uInt>(available);
    stream.next_in = const_cast<Bytef*>(data);

    // Room for one spare byte so an oversized stream is detected
    std::string out(expectedSize + 1, '\0');
    stream.avail_out = static_cast<uInt>(out.size());
    stream.next_out = reinterpret_cast<Bytef*>(&out[0]);

    int ret = inflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        inflateEnd(&stream);
        throw std::runtime_error("corrupt packed object stream");
    }
    consumed = stream.total_in;
    size_t produced = stream.total_out;
    inflateEnd(&stream);
    if (produced != expectedSize) {
        throw std::runtime_error("packed object size mismatch");
    }
    out.resize(produced);
    return out;
}

}
