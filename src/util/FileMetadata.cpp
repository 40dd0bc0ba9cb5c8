#include "util/FileMetadata.hpp"

#include <sys/stat.h>

namespace gitcl {

namespace {
uint64_t toNanoseconds(const struct timespec& ts) {
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
}
}

FileMetadata getFileMetadata(const std::filesystem::path& filePath) {
    FileMetadata metadata;
    struct stat st {};
    if (::stat(filePath.c_str(), &st) != 0) {
        return metadata;
    }

    metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
    metadata.mtimeNs = toNanoseconds(st.st_mtim);
    metadata.ctimeNs = toNanoseconds(st.st_ctim);
    metadata.dev = static_cast<uint32_t>(st.st_dev);
    metadata.ino = static_cast<uint32_t>(st.st_ino);
    metadata.uid = static_cast<uint32_t>(st.st_uid);
    metadata.gid = static_cast<uint32_t>(st.st_gid);

    // Git only distinguishes executable from regular files
    metadata.mode = (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) ? 0100755 : 0100644;

    return metadata;
}

}
