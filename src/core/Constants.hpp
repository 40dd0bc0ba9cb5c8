#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Git format constants used throughout the codebase
 */
namespace gitcl {

namespace Constants {
    // Object ids
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 object id as hex
    constexpr size_t SHA1_RAW_LENGTH = 20;        // SHA-1 object id as raw bytes in trees/index/pack
    constexpr const char* NULL_OBJECT_ID = "0000000000000000000000000000000000000000";

    // Object storage structure
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // First 2 chars of hash form directory name

    // Tree entry modes (written as octal text in tree objects)
    constexpr uint32_t MODE_FILE = 0100644;       // Regular file (-rw-r--r--)
    constexpr uint32_t MODE_EXECUTABLE = 0100755; // Executable file (-rwxr-xr-x)
    constexpr uint32_t MODE_SYMLINK = 0120000;
    constexpr uint32_t MODE_GITLINK = 0160000;    // Submodule commit
    constexpr uint32_t MODE_DIR = 0040000;        // Directory

    // Commit message trailer carrying the review identity
    constexpr const char* CHANGE_ID_TRAILER = "Change-Id";

    constexpr size_t SHORT_HASH_LENGTH = 9;
}
}
