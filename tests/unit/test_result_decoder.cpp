/**
 * @file test_result_decoder.cpp
 * @brief Unit tests for locating and decoding the result record.
 */

#include "runner/result_decoder.hpp"
#include "runner/protocol.hpp"
#include "logging/json_sink.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <string>

using namespace sandbox_exec;

namespace {

std::string record_line(const std::string& json) {
    return std::string(protocol::kResultSentinel) + json + "\n";
}

ProcessOutput clean_exit(std::string stdout_text, std::string stderr_text = {}) {
    ProcessOutput out;
    out.stdout_text = std::move(stdout_text);
    out.stderr_text = std::move(stderr_text);
    out.exit_code = 0;
    out.elapsed_seconds = 0.25;
    return out;
}

}  // namespace

TEST(LocateRecordTest, SplitsPayloadAndResidue) {
    auto text = "native noise\n" + record_line(R"({"a":1})") + "after\n";
    auto rec = locate_record(text);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->payload, R"({"a":1})");
    EXPECT_EQ(rec->residue, "native noise\nafter\n");
}

TEST(LocateRecordTest, UsesLastSentinelAndStripsCarriageReturn) {
    auto text = record_line("stale") + std::string(protocol::kResultSentinel) + "{}\r\n";
    auto rec = locate_record(text);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->payload, "{}");
}

TEST(LocateRecordTest, NoSentinel) {
    EXPECT_FALSE(locate_record("just output\n").has_value());
}

class ResultDecoderTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    ResultDecoder decoder_{logger_};
};

TEST_F(ResultDecoderTest, DecodesValueAndLocals) {
    auto out = clean_exit(record_line(R"({"stdout":"hi\n","stderr":"","value":42,)"
                                      R"("exception":null,"locals":{"x":"3"},)"
                                      R"("files_written":["a.txt"],"execution_time":0.01})"));
    out.memory_limit = MemoryLimit::Applied;
    auto result = decoder_.decode(out, {"a.txt"});

    EXPECT_TRUE(result.ok());
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(result.value->asInt(), 42);
    EXPECT_EQ(result.stdout_text, "hi\n");
    EXPECT_EQ(result.locals_snapshot.at("x"), "3");
    EXPECT_EQ(result.files_written, std::vector<std::string>{"a.txt"});
    EXPECT_DOUBLE_EQ(result.execution_time, 0.25);
    EXPECT_EQ(result.memory_limit, MemoryLimit::Applied);
}

TEST_F(ResultDecoderTest, AbsentValueKeyMeansNoValue) {
    auto result = decoder_.decode(clean_exit(record_line(R"({"stdout":"","exception":null})")), {});
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(ResultDecoderTest, NullValueIsStillAValue) {
    auto result = decoder_.decode(clean_exit(record_line(R"({"value":null,"exception":null})")), {});
    ASSERT_TRUE(result.value.has_value());
    EXPECT_TRUE(result.value->isNull());
}

TEST_F(ResultDecoderTest, ExceptionExcludesValue) {
    auto out = clean_exit(record_line(R"({"value":1,"exception":{"kind":"ZeroDivisionError",)"
                                      R"("message":"division by zero","trace":"Traceback..."}})"));
    auto result = decoder_.decode(out, {});

    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, "ZeroDivisionError");
    EXPECT_EQ(result.exception->message, "division by zero");
    EXPECT_EQ(result.exception->trace, "Traceback...");
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(ResultDecoderTest, UncapturedOutputIsAppended) {
    auto out = clean_exit("from C extension\n" + record_line(R"({"stdout":"print\n","exception":null})"),
                          "warning from subprocess\n");
    auto result = decoder_.decode(out, {});
    EXPECT_EQ(result.stdout_text, "print\nfrom C extension\n");
    EXPECT_EQ(result.stderr_text, "warning from subprocess\n");
}

TEST_F(ResultDecoderTest, CorruptRecordIsParseFailureWithRawOutput) {
    auto raw = "partial\n" + record_line("{\"stdout\": \"unterminated");
    auto result = decoder_.decode(clean_exit(raw, "err"), {"f.txt"});

    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kParseFailure);
    EXPECT_EQ(result.stdout_text, raw);
    EXPECT_EQ(result.stderr_text, "err");
    EXPECT_EQ(result.files_written, std::vector<std::string>{"f.txt"});
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(ResultDecoderTest, DeeplyNestedRecordIsParseFailure) {
    auto raw = record_line(R"({"stdout":"","value":)" + std::string(1100, '[') + "1"
                           + std::string(1100, ']') + "}");
    auto result = decoder_.decode(clean_exit(raw), {});

    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kParseFailure);
    EXPECT_EQ(result.stdout_text, raw);
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(ResultDecoderTest, NonObjectRecordIsParseFailure) {
    auto result = decoder_.decode(clean_exit(record_line("[1,2,3]")), {});
    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kParseFailure);
}

TEST_F(ResultDecoderTest, MissingRecordAfterCleanExitIsParseFailure) {
    auto result = decoder_.decode(clean_exit("no record here\n"), {});
    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kParseFailure);
    EXPECT_EQ(result.stdout_text, "no record here\n");
}

TEST_F(ResultDecoderTest, MissingRecordAfterCrashIsProcessError) {
    ProcessOutput out;
    out.stderr_text = "Segmentation fault\n";
    out.term_signal = SIGSEGV;
    auto result = decoder_.decode(out, {});

    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kProcessError);
    EXPECT_NE(result.exception->message.find("signal"), std::string::npos);
    EXPECT_EQ(result.stderr_text, "Segmentation fault\n");
}

TEST_F(ResultDecoderTest, TimeoutWinsOverAnyRecord) {
    auto out = clean_exit(record_line(R"({"value":1,"exception":null})"));
    out.timed_out = true;
    out.exit_code.reset();
    out.term_signal = SIGKILL;
    auto result = decoder_.decode(out, {});

    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kTimeout);
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(ResultDecoderTest, RecordOnStderrIsAccepted) {
    auto out = clean_exit("plain\n", record_line(R"({"value":"x","exception":null})"));
    auto result = decoder_.decode(out, {});
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(result.value->asString(), "x");
    EXPECT_EQ(result.stdout_text, "plain\n");
}

TEST(SpawnFailureTest, IsProcessError) {
    auto result = ResultDecoder::spawn_failure(Error{ErrorKind::Spawn, "Executable not found: python3"},
                                               {"a.txt"});
    ASSERT_TRUE(result.exception.has_value());
    EXPECT_EQ(result.exception->kind, failure_kind::kProcessError);
    EXPECT_NE(result.exception->message.find("python3"), std::string::npos);
    EXPECT_EQ(result.files_written, std::vector<std::string>{"a.txt"});
}
