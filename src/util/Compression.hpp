#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitcl {

/// zlib deflate as used for loose objects and packfile entries; throws std::runtime_error
std::vector<uint8_t> zlibCompress(const std::string& data);

/// zlib inflate of a complete stream; throws std::runtime_error on corrupt input
std::string zlibDecompress(const std::vector<uint8_t>& compressed);

/**
 * @brief Inflate one zlib stream starting at `data`, as embedded in a packfile
 * @param consumed Set to the number of compressed bytes the stream occupied
 */
std::string zlibInflateEmbedded(const uint8_t* data, size_t available, size_t expectedSize, size_t& consumed);

}
