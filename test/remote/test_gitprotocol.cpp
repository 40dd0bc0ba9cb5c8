#include <gtest/gtest.h>
#include "remote/GitProtocol.hpp"
#include "util/Compression.hpp"
#include "util/Sha1Hasher.hpp"

using namespace gitcl;

namespace {

std::string withNul(const std::string& before, const std::string& after) {
    std::string s = before;
    s += '\0';
    s += after;
    return s;
}

}

TEST(PktLineTest, EncodesLengthIncludingHeader) {
    EXPECT_EQ(PktLine::encode("a\n"), "0006a\n");
    EXPECT_EQ(PktLine::encode(""), "0004");
}

TEST(PktLineTest, DecodesAndDropsFlush) {
    std::string stream = PktLine::encode("first\n") + PktLine::FLUSH + PktLine::encode("second");
    auto lines = PktLine::decode(stream);
    ASSERT_TRUE(lines.has_value());
    EXPECT_EQ(lines.value(), (std::vector<std::string>{"first", "second"}));
}

TEST(PktLineTest, RejectsTruncatedInput) {
    EXPECT_FALSE(PktLine::decode("00").has_value());
    EXPECT_FALSE(PktLine::decode("0010abc").has_value());
    EXPECT_FALSE(PktLine::decode("zzzzabc").has_value());
}

TEST(ReceivePackTest, ParsesAdvertisement) {
    const std::string head(40, 'a');
    const std::string other(40, 'b');
    std::string body = PktLine::encode("# service=git-receive-pack\n") + PktLine::FLUSH +
                       PktLine::encode(withNul(head + " refs/heads/master", "report-status side-band-64k ofs-delta\n")) +
                       PktLine::encode(other + " refs/heads/stable\n") + PktLine::FLUSH;

    auto adv = ReceivePack::parseAdvertisement(body);
    ASSERT_TRUE(adv.has_value()) << adv.error().message;
    EXPECT_EQ(adv.value().refs.at("refs/heads/master"), head);
    EXPECT_EQ(adv.value().refs.at("refs/heads/stable"), other);
    EXPECT_TRUE(adv.value().supports("report-status"));
    EXPECT_TRUE(adv.value().supports("ofs-delta"));
    EXPECT_FALSE(adv.value().supports("atomic"));
}

// An empty repository advertises only its capabilities
TEST(ReceivePackTest, ParsesCapabilitiesOnlyAdvertisement) {
    std::string body = PktLine::encode(withNul(std::string(40, '0') + " capabilities^{}", "report-status\n")) +
                       PktLine::FLUSH;
    auto adv = ReceivePack::parseAdvertisement(body);
    ASSERT_TRUE(adv.has_value());
    EXPECT_TRUE(adv.value().refs.empty());
    EXPECT_TRUE(adv.value().supports("report-status"));
}

TEST(ReceivePackTest, RejectsMalformedRefLine) {
    auto adv = ReceivePack::parseAdvertisement(PktLine::encode("short refs/heads/x\n"));
    ASSERT_FALSE(adv.has_value());
    EXPECT_EQ(adv.error().code, ErrorCode::ProtocolError);
}

TEST(ReceivePackTest, BuildsCommandThenPack) {
    const std::string zero(40, '0');
    const std::string id(40, 'c');
    std::string request = ReceivePack::buildRequest(zero, id, "refs/for/master", {"report-status", "quiet"}, "PACKDATA");

    std::string command = withNul(zero + " " + id + " refs/for/master", "report-status quiet\n");
    EXPECT_EQ(request, PktLine::encode(command) + "0000PACKDATA");
}

TEST(ReceivePackTest, ReportStatusOk) {
    std::string body = PktLine::encode("unpack ok\n") + PktLine::encode("ok refs/for/master\n") + PktLine::FLUSH;
    EXPECT_TRUE(ReceivePack::checkReportStatus(body, "refs/for/master").has_value());
}

TEST(ReceivePackTest, ReportStatusRejected) {
    std::string body = PktLine::encode("unpack ok\n") +
                       PktLine::encode("ng refs/for/master no new changes\n") + PktLine::FLUSH;
    auto status = ReceivePack::checkReportStatus(body, "refs/for/master");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::Conflict);
    EXPECT_NE(status.error().message.find("no new changes"), std::string::npos);
}

TEST(ReceivePackTest, ReportStatusUnpackFailure) {
    std::string body = PktLine::encode("unpack index-pack abnormal exit\n") + PktLine::FLUSH;
    auto status = ReceivePack::checkReportStatus(body, "refs/for/master");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::ProtocolError);
}

TEST(ReceivePackTest, ReportStatusMissingRef) {
    std::string body = PktLine::encode("unpack ok\n") + PktLine::FLUSH;
    EXPECT_FALSE(ReceivePack::checkReportStatus(body, "refs/for/master").has_value());
    EXPECT_FALSE(ReceivePack::checkReportStatus("", "refs/for/master").has_value());
}

TEST(PackWriterTest, WritesHeaderEntriesAndTrailer) {
    std::string payload(300, 'x');
    std::string pack = PackWriter::build({PackObject{std::string(40, 'a'), ObjectType::Blob, payload}});

    ASSERT_GT(pack.size(), 12u + 20u);
    EXPECT_EQ(pack.substr(0, 4), "PACK");
    EXPECT_EQ(pack.substr(4, 4), std::string("\0\0\0\2", 4));
    EXPECT_EQ(pack.substr(8, 4), std::string("\0\0\0\1", 4));

    // Type 3 (blob), size 300 = 0b1_0010_1100: low nibble 0xc with continuation, then 300 >> 4 = 18
    EXPECT_EQ(static_cast<uint8_t>(pack[12]), 0x80 | (3 << 4) | 0x0c);
    EXPECT_EQ(static_cast<uint8_t>(pack[13]), 18);

    const auto* data = reinterpret_cast<const uint8_t*>(pack.data()) + 14;
    size_t consumed = 0;
    EXPECT_EQ(zlibInflateEmbedded(data, pack.size() - 14 - 20, payload.size(), consumed), payload);
    EXPECT_EQ(14 + consumed + 20, pack.size());

    Sha1Hasher hasher;
    hasher.update(pack.substr(0, pack.size() - 20));
    std::vector<uint8_t> digest = hasher.digest();
    EXPECT_EQ(pack.substr(pack.size() - 20), std::string(digest.begin(), digest.end()));
}

TEST(PackWriterTest, EmptyPack) {
    std::string pack = PackWriter::build({});
    EXPECT_EQ(pack.size(), 12u + 20u);
    EXPECT_EQ(pack.substr(8, 4), std::string(4, '\0'));
}
