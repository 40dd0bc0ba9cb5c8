#include <gtest/gtest.h>
#include "remote/GerritJson.hpp"

using namespace gitcl;

namespace {

const std::string CHANGE_BODY = R"()]}'
{
  "id": "demo~master~I8473b95934b5732ac55d26311a706c9c2bde9940",
  "project": "demo",
  "branch": "master",
  "change_id": "I8473b95934b5732ac55d26311a706c9c2bde9940",
  "subject": "Implement the frobnicator",
  "status": "NEW",
  "_number": 3965,
  "owner": {"_account_id": 1000096, "name": "John Doe", "email": "john.doe@example.com", "username": "jdoe"},
  "revisions": {
    "184ebe53805e102605d11f6b143486d15c23a09c": {
      "_number": 2,
      "created": "2024-01-02 10:00:00.000000000",
      "commit": {"parents": [{"commit": "1eee2c9d8f352483781e772f35dc586a69ff5646"}], "subject": "Implement"}
    },
    "a1b2c3d4e5f60718293a4b5c6d7e8f9012345678": {
      "_number": 1,
      "created": "2024-01-01 10:00:00.000000000",
      "commit": {"parents": [{"commit": "0000000000000000000000000000000000000001"}]}
    }
  }
}
)";

}

TEST(GerritJsonTest, StripsXssiGuard) {
    auto body = GerritJson::stripXssi(")]}'\n[1,2]");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body.value(), "[1,2]");

    auto missing = GerritJson::stripXssi("[1,2]");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ProtocolError);
}

TEST(GerritJsonTest, ParsesChangeWithRevisions) {
    auto change = GerritJson::parseChange(CHANGE_BODY);
    ASSERT_TRUE(change.has_value()) << change.error().message;
    const Change& c = change.value();

    EXPECT_EQ(c.changeId, "I8473b95934b5732ac55d26311a706c9c2bde9940");
    EXPECT_EQ(c.uuid, "demo~master~I8473b95934b5732ac55d26311a706c9c2bde9940");
    EXPECT_EQ(c.project, "demo");
    EXPECT_EQ(c.branch, "master");
    EXPECT_EQ(c.number, 3965);
    EXPECT_EQ(c.status, ChangeStatus::New);
    EXPECT_EQ(c.owner.display(), "John Doe <john.doe@example.com>");

    // Sorted by number regardless of map order
    ASSERT_EQ(c.patchSets.size(), 2u);
    EXPECT_EQ(c.patchSets[0].number, 1);
    EXPECT_EQ(c.patchSets[0].parentHash, "0000000000000000000000000000000000000001");
    EXPECT_EQ(c.patchSets[1].number, 2);
    EXPECT_EQ(c.patchSets[1].commitHash, "184ebe53805e102605d11f6b143486d15c23a09c");
    EXPECT_EQ(c.patchSets[1].parentHash, "1eee2c9d8f352483781e772f35dc586a69ff5646");
    EXPECT_EQ(c.patchSets[1].created, "2024-01-02 10:00:00.000000000");
    EXPECT_EQ(c.latest()->number, 2);
}

TEST(GerritJsonTest, ParsesChangeList) {
    auto changes = GerritJson::parseChanges(")]}'\n"
        R"([{"change_id":"I0000000000000000000000000000000000000001","_number":1,"status":"MERGED","subject":"a"},
            {"change_id":"I0000000000000000000000000000000000000002","_number":2,"status":"ABANDONED","subject":"b"},
            {"change_id":"I0000000000000000000000000000000000000003","_number":3,"status":"DRAFT","subject":"c"}])");
    ASSERT_TRUE(changes.has_value()) << changes.error().message;
    ASSERT_EQ(changes.value().size(), 3u);
    EXPECT_EQ(changes.value()[0].status, ChangeStatus::Merged);
    EXPECT_EQ(changes.value()[1].status, ChangeStatus::Abandoned);
    EXPECT_EQ(changes.value()[2].status, ChangeStatus::New);
    EXPECT_TRUE(changes.value()[0].patchSets.empty());
}

TEST(GerritJsonTest, EmptyListIsEmpty) {
    auto changes = GerritJson::parseChanges(")]}'\n[]\n");
    ASSERT_TRUE(changes.has_value());
    EXPECT_TRUE(changes.value().empty());
}

TEST(GerritJsonTest, RejectsMalformedBodies) {
    EXPECT_EQ(GerritJson::parseChange(")]}'\n{not json").error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(GerritJson::parseChange(")]}'\n{\"subject\":\"no id\"}").error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(GerritJson::parseChanges(")]}'\n{\"change_id\":\"I12345678\"}").error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(GerritJson::parseChange(")]}'\n{\"change_id\":\"I12345678\",\"status\":\"WEIRD\"}").error().code,
              ErrorCode::ProtocolError);
}

TEST(GerritJsonTest, RejectsDuplicatePatchSetNumbers) {
    auto change = GerritJson::parseChange(")]}'\n"
        R"({"change_id":"I12345678","revisions":{
              "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa":{"_number":1},
              "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb":{"_number":1}}})");
    ASSERT_FALSE(change.has_value());
    EXPECT_EQ(change.error().code, ErrorCode::ProtocolError);
}

TEST(GerritJsonTest, ErrorMessageUnwrapsJson) {
    EXPECT_EQ(GerritJson::errorMessage(")]}'\n\"change is closed\""), "change is closed");
    EXPECT_EQ(GerritJson::errorMessage("{\"message\":\"nope\"}"), "nope");
    EXPECT_EQ(GerritJson::errorMessage("Not found\n"), "Not found");
}

TEST(GerritJsonTest, DecodesBase64) {
    auto decoded = GerritJson::decodeBase64("RnJvbSBhYmMK\nZGlmZg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "From abc\ndiff");

    EXPECT_FALSE(GerritJson::decodeBase64("@@@").has_value());
}
