/**
 * @file test_tool_payload.cpp
 * @brief Unit tests for tool-call payload parsing and result formatting.
 */

#include "tool/tool_payload.hpp"

#include <gtest/gtest.h>

using namespace sandbox_exec;

class ToolPayloadTest : public ::testing::Test {
protected:
    LimitsConfig limits_;
};

TEST_F(ToolPayloadTest, MinimalPayloadUsesDefaults) {
    limits_.default_timeout_ms = 12000;
    auto req = parse_tool_request(R"json({"code": "print(1)"})json", limits_);
    ASSERT_TRUE(req.has_value()) << req.error().message;

    EXPECT_EQ(req->code, "print(1)");
    EXPECT_EQ(req->timeout, Duration{12000});
    EXPECT_FALSE(req->persist);
    EXPECT_TRUE(req->globals_enabled);
    EXPECT_TRUE(req->files.empty());
    EXPECT_TRUE(req->requirements.empty());
    EXPECT_FALSE(req->session_id.has_value());
    EXPECT_FALSE(req->max_memory_mb.has_value());
}

TEST_F(ToolPayloadTest, FullPayload) {
    auto req = parse_tool_request(R"({
        "code": "def main(): return 1",
        "timeout": 2.5,
        "persist": true,
        "globals": false,
        "files": [{"path": "data/in.csv", "content": "a,b\n1,2\n"}, {"path": "empty.txt"}],
        "requirements": ["numpy"],
        "session_id": "s-1",
        "max_memory_mb": 256
    })", limits_);
    ASSERT_TRUE(req.has_value()) << req.error().message;

    EXPECT_EQ(req->timeout, Duration{2500});
    EXPECT_TRUE(req->persist);
    EXPECT_FALSE(req->globals_enabled);
    ASSERT_EQ(req->files.size(), 2u);
    EXPECT_EQ(req->files[0], (FileSpec{"data/in.csv", "a,b\n1,2\n"}));
    EXPECT_EQ(req->files[1].content, "");
    EXPECT_EQ(req->requirements, std::vector<std::string>{"numpy"});
    EXPECT_EQ(req->session_id, std::optional<std::string>{"s-1"});
    EXPECT_EQ(req->max_memory_mb, std::optional<uint64_t>{256});
    EXPECT_TRUE(req->uses_session());
}

TEST_F(ToolPayloadTest, NullOptionalsAreAbsent) {
    auto req = parse_tool_request(R"({"code": "", "session_id": null, "max_memory_mb": null})", limits_);
    ASSERT_TRUE(req.has_value());
    EXPECT_FALSE(req->session_id.has_value());
    EXPECT_FALSE(req->max_memory_mb.has_value());
}

TEST_F(ToolPayloadTest, RejectsInvalidPayloads) {
    for (const char* bad : {
             "not json",
             "[1, 2]",
             R"({})",
             R"({"code": 5})",
             R"({"code": "x", "timeout": 0})",
             R"({"code": "x", "timeout": -1})",
             R"({"code": "x", "timeout": "10"})",
             R"({"code": "x", "persist": "yes"})",
             R"({"code": "x", "files": [{"content": "no path"}]})",
             R"({"code": "x", "files": {"path": "a"}})",
             R"({"code": "x", "requirements": [1]})",
             R"({"code": "x", "session_id": 7})",
             R"({"code": "x", "max_memory_mb": 0})",
             R"({"code": "x", "max_memory_mb": 1.5})",
             R"({"code": "x", "max_memory_mb": 1e19})",
             R"({"code": "x", "max_memory_mb": 18446744073709551615})",
             R"({"code": "x", "max_memory_mb": 1073741825})",
             R"({"code": "x", "timeout": 1e10})",
             R"({"code": "x", "timeout": 1e300})",
             R"({"code": "x", "timeout": 86401})",
         }) {
        auto req = parse_tool_request(bad, limits_);
        ASSERT_FALSE(req.has_value()) << bad;
        EXPECT_EQ(req.error().kind, ErrorKind::InvalidRequest) << bad;
    }
}

TEST_F(ToolPayloadTest, DeeplyNestedPayloadIsInvalidRequest) {
    std::string payload = R"({"code": "x", "extra": )" + std::string(1100, '[')
                          + std::string(1100, ']') + "}";
    auto req = parse_tool_request(payload, limits_);
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().kind, ErrorKind::InvalidRequest);
}

TEST_F(ToolPayloadTest, LimitsAtTheirMaximumAreAccepted) {
    auto req = parse_tool_request(R"({"code": "x", "timeout": 86400, "max_memory_mb": 1073741824})",
                                  limits_);
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_EQ(req->timeout, kMaxTimeout);
    ASSERT_TRUE(req->max_memory_mb.has_value());
    EXPECT_EQ(*req->max_memory_mb, kMaxMemoryMb);
}

TEST_F(ToolPayloadTest, SubMillisecondTimeoutRoundsUp) {
    auto req = parse_tool_request(R"({"code": "x", "timeout": 0.0001})", limits_);
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->timeout, Duration{1});
}

TEST(ResultFormattingTest, JsonCarriesEveryField) {
    ExecutionResult result;
    result.stdout_text = "hello\n";
    result.value = Json::Value(42);
    result.locals_snapshot = {{"x", "1"}};
    result.files_written = {"a.txt"};
    result.execution_time = 0.5;
    result.memory_limit = MemoryLimit::Applied;
    result.session_id = "s1";

    auto json = result_to_json(result);
    EXPECT_EQ(json["stdout"].asString(), "hello\n");
    EXPECT_EQ(json["value"].asInt(), 42);
    EXPECT_TRUE(json["has_value"].asBool());
    EXPECT_TRUE(json["exception"].isNull());
    EXPECT_EQ(json["locals"]["x"].asString(), "1");
    EXPECT_EQ(json["files_written"][0].asString(), "a.txt");
    EXPECT_DOUBLE_EQ(json["execution_time"].asDouble(), 0.5);
    EXPECT_EQ(json["memory_limit"].asString(), "applied");
    EXPECT_EQ(json["session_id"].asString(), "s1");
}

TEST(ResultFormattingTest, BlockForSuccessfulRun) {
    ExecutionResult result;
    result.stdout_text = "hello";
    result.value = Json::Value(Json::arrayValue);
    result.value->append(1);
    result.value->append("two");
    result.locals_snapshot = {{"x", "3"}};
    result.files_written = {"a.txt", "b/c.txt"};
    result.execution_time = 0.0421;

    auto block = format_result_block(result);
    EXPECT_NE(block.find("stdout:\nhello\n"), std::string::npos);
    EXPECT_NE(block.find("result: [1,\"two\"]\n"), std::string::npos);
    EXPECT_NE(block.find("  x = 3\n"), std::string::npos);
    EXPECT_NE(block.find("files written: a.txt, b/c.txt\n"), std::string::npos);
    EXPECT_NE(block.find("execution time: 0.042s\n"), std::string::npos);
    EXPECT_EQ(block.find("exception:"), std::string::npos);
}

TEST(ResultFormattingTest, BlockForException) {
    ExecutionResult result;
    result.exception = ExceptionInfo{"ValueError", "bad input", "Traceback (most recent call last):\n"};

    auto block = format_result_block(result);
    EXPECT_NE(block.find("result: <none>\n"), std::string::npos);
    EXPECT_NE(block.find("locals: <none>\n"), std::string::npos);
    EXPECT_NE(block.find("exception: ValueError: bad input\nTraceback"), std::string::npos);
}
