#pragma once

#include <cstdint>
#include <filesystem>

namespace gitcl {

/**
 * @brief Stat data recorded in git index entries
 *
 * git compares these against the working tree to decide whether a file
 * needs re-hashing; zero fields only cost a re-hash on the next status.
 */
struct FileMetadata {
    uint64_t sizeBytes{0};   // File size in bytes
    uint64_t mtimeNs{0};     // Last modification time in nanoseconds
    uint64_t ctimeNs{0};     // Inode change time in nanoseconds
    uint32_t mode{0};        // 0100644 regular, 0100755 executable
    uint32_t dev{0};
    uint32_t ino{0};
    uint32_t uid{0};
    uint32_t gid{0};
};

/**
 * @brief Read file metadata from filesystem
 * @return FileMetadata for the path, or all zeros on error
 */
FileMetadata getFileMetadata(const std::filesystem::path& filePath);

}
