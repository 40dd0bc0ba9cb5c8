#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include "test_utils.hpp"
#include "core/ObjectStore.hpp"
#include "core/PackReader.hpp"
#include "util/Compression.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

using namespace gitcl;
using namespace gitcl::test::utils;

namespace {

void putBe32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xff));
    out.push_back(static_cast<char>((v >> 16) & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
    out.push_back(static_cast<char>(v & 0xff));
}

std::string entryHeader(int type, size_t size) {
    std::string h;
    uint8_t c = static_cast<uint8_t>((type << 4) | (size & 0x0f));
    size >>= 4;
    while (size) {
        h.push_back(static_cast<char>(c | 0x80));
        c = static_cast<uint8_t>(size & 0x7f);
        size >>= 7;
    }
    h.push_back(static_cast<char>(c));
    return h;
}

std::string deflate(const std::string& data) {
    auto bytes = zlibCompress(data);
    return std::string(bytes.begin(), bytes.end());
}

std::string sha1(const std::string& data) {
    auto hasher = HasherFactory::createDefault();
    hasher->update(data);
    auto d = hasher->digest();
    return std::string(d.begin(), d.end());
}

/**
 * Writes objects/pack/pack-test.{pack,idx} by hand: entries are appended
 * raw, the index is version 2.
 */
class PackBuilder {
public:
    size_t addWhole(ObjectType type, const std::string& payload, const std::string& id) {
        size_t offset = 12 + body.size();
        body += entryHeader(static_cast<int>(type), payload.size()) + deflate(payload);
        ids.emplace_back(id, offset);
        return offset;
    }

    void addOfsDelta(size_t baseOffset, const std::string& delta, const std::string& id) {
        size_t offset = 12 + body.size();
        uint64_t back = offset - baseOffset;
        std::string enc(1, static_cast<char>(back & 0x7f));
        while (back >>= 7) {
            --back;
            enc.insert(enc.begin(), static_cast<char>(0x80 | (back & 0x7f)));
        }
        body += entryHeader(6, delta.size()) + enc + deflate(delta);
        ids.emplace_back(id, offset);
    }

    void addRefDelta(const std::string& baseId, const std::string& delta, const std::string& id) {
        size_t offset = 12 + body.size();
        std::vector<uint8_t> raw;
        IHasher::fromHex(baseId, raw);
        body += entryHeader(7, delta.size()) + std::string(raw.begin(), raw.end()) + deflate(delta);
        ids.emplace_back(id, offset);
    }

    void write(const fs::path& objectsDir) {
        std::string pack = "PACK";
        putBe32(pack, 2);
        putBe32(pack, static_cast<uint32_t>(ids.size()));
        pack += body;
        std::string packSum = sha1(pack);
        pack += packSum;

        std::sort(ids.begin(), ids.end());
        std::string idx = "\377tOc";
        putBe32(idx, 2);
        for (int b = 0; b < 256; ++b) {
            uint32_t n = 0;
            for (const auto& [id, off] : ids) {
                std::vector<uint8_t> raw;
                IHasher::fromHex(id, raw);
                if (raw[0] <= b) ++n;
            }
            putBe32(idx, n);
        }
        for (const auto& [id, off] : ids) {
            std::vector<uint8_t> raw;
            IHasher::fromHex(id, raw);
            idx.append(raw.begin(), raw.end());
        }
        for (size_t i = 0; i < ids.size(); ++i) putBe32(idx, 0);  // CRCs are not checked on read
        for (const auto& [id, off] : ids) putBe32(idx, static_cast<uint32_t>(off));
        idx += packSum;
        idx += sha1(idx);

        fs::create_directories(objectsDir / "pack");
        std::ofstream(objectsDir / "pack" / "pack-test.pack", std::ios::binary) << pack;
        std::ofstream(objectsDir / "pack" / "pack-test.idx", std::ios::binary) << idx;
    }

private:
    std::string body;
    std::vector<std::pair<std::string, size_t>> ids;
};

// "hello world\n" -> "hello there\n": copy 6 bytes from offset 0, insert "there\n"
const std::string BASE_TEXT = "hello world\n";
const std::string DERIVED_TEXT = "hello there\n";
const std::string DELTA = std::string("\x0c\x0c\x90\x06\x06", 5) + "there\n";

}

class PackReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        initTestRepo(tempDir);
        gitDir = tempDir / ".git";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path gitDir;
};

TEST_F(PackReaderTest, ApplyDeltaCopiesAndInserts) {
    EXPECT_EQ(applyDelta(BASE_TEXT, DELTA), DERIVED_TEXT);
}

TEST_F(PackReaderTest, ApplyDeltaRejectsWrongBase) {
    EXPECT_THROW(applyDelta("short", DELTA), std::runtime_error);
}

TEST_F(PackReaderTest, ReadsWholeAndOfsDeltaObjects) {
    ObjectStore hashing(gitDir);
    std::string baseId = hashing.hashObject(ObjectType::Blob, BASE_TEXT);
    std::string derivedId = hashing.hashObject(ObjectType::Blob, DERIVED_TEXT);

    PackBuilder builder;
    size_t baseOffset = builder.addWhole(ObjectType::Blob, BASE_TEXT, baseId);
    builder.addOfsDelta(baseOffset, DELTA, derivedId);
    builder.write(gitDir / "objects");

    ObjectStore store(gitDir);
    EXPECT_TRUE(store.hasObject(baseId));
    EXPECT_TRUE(store.hasObject(derivedId));
    EXPECT_EQ(store.readBlob(baseId), BASE_TEXT);
    EXPECT_EQ(store.readBlob(derivedId), DERIVED_TEXT);
    EXPECT_FALSE(fs::exists(store.getObjectPath(baseId)));
}

TEST_F(PackReaderTest, RefDeltaBaseMayBeLoose) {
    ObjectStore loose(gitDir);
    std::string baseId = loose.writeBlob(BASE_TEXT);
    std::string derivedId = loose.hashObject(ObjectType::Blob, DERIVED_TEXT);

    PackBuilder builder;
    builder.addRefDelta(baseId, DELTA, derivedId);
    builder.write(gitDir / "objects");

    ObjectStore store(gitDir);
    EXPECT_EQ(store.readBlob(derivedId), DERIVED_TEXT);
}

TEST_F(PackReaderTest, PackedCommitIsReadable) {
    ObjectStore hashing(gitDir);
    std::string tree = hashing.hashObject(ObjectType::Tree, "");
    std::string payload = "tree " + tree + "\n"
                          "author A <a@example.com> 1 +0000\n"
                          "committer A <a@example.com> 1 +0000\n"
                          "\n"
                          "packed\n";
    std::string id = hashing.hashObject(ObjectType::Commit, payload);

    PackBuilder builder;
    builder.addWhole(ObjectType::Tree, "", tree);
    builder.addWhole(ObjectType::Commit, payload, id);
    builder.write(gitDir / "objects");

    ObjectStore store(gitDir);
    CommitObject commit = store.readCommit(id);
    EXPECT_EQ(commit.treeHash, tree);
    EXPECT_EQ(commit.message, "packed\n");
    EXPECT_TRUE(store.readTree(tree).empty());
}

TEST_F(PackReaderTest, UnknownIdIsNotFound) {
    PackBuilder builder;
    ObjectStore hashing(gitDir);
    builder.addWhole(ObjectType::Blob, BASE_TEXT, hashing.hashObject(ObjectType::Blob, BASE_TEXT));
    builder.write(gitDir / "objects");

    PackReader reader(gitDir / "objects");
    EXPECT_EQ(reader.packCount(), 1u);
    EXPECT_FALSE(reader.contains("2222222222222222222222222222222222222222"));
    ObjectStore store(gitDir);
    EXPECT_THROW(reader.read("2222222222222222222222222222222222222222", store), ObjectNotFoundError);
}
