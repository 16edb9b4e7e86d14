#include <gtest/gtest.h>

#include "compare.h"
#include "test_utils.h"

using nlohmann::json;

namespace {

ExecutionResult Finished(const std::string& stdout_str) {
  ExecutionResult ret;
  ret.success = true;
  ret.exit_code = 0;
  ret.stdout_str = stdout_str;
  ret.elapsed_ms = 12;
  return ret;
}

} // namespace

TEST(JsonEqualTest, Scalars) {
  EXPECT_TRUE(JsonEqual(json(1), json(1)));
  EXPECT_FALSE(JsonEqual(json(1), json(2)));
  EXPECT_TRUE(JsonEqual(json("a"), json("a")));
  EXPECT_FALSE(JsonEqual(json("1"), json(1)));
  EXPECT_TRUE(JsonEqual(json(nullptr), json(nullptr)));
  EXPECT_FALSE(JsonEqual(json(false), json(nullptr)));
  EXPECT_FALSE(JsonEqual(json(0), json(false)));
}

TEST(JsonEqualTest, NumbersCompareByValue) {
  EXPECT_TRUE(JsonEqual(json(2), json(2.0)));
  EXPECT_TRUE(JsonEqual(json(3u), json(3)));
  EXPECT_FALSE(JsonEqual(json(0.1 + 0.2), json(0.3)));
  EXPECT_TRUE(JsonEqual(json(0.1 + 0.2), json(0.3), 1e-9));
  EXPECT_FALSE(JsonEqual(json(1.5), json(1.6), 1e-9));
}

TEST(JsonEqualTest, ArraysAreOrdered) {
  EXPECT_TRUE(JsonEqual(json::parse("[1,2,3]"), json::parse("[1,2,3]")));
  EXPECT_FALSE(JsonEqual(json::parse("[1,2,3]"), json::parse("[3,2,1]")));
  EXPECT_FALSE(JsonEqual(json::parse("[1,2]"), json::parse("[1,2,3]")));
}

TEST(JsonEqualTest, ObjectsIgnoreKeyOrder) {
  EXPECT_TRUE(JsonEqual(json::parse(R"({"a":1,"b":[1,{"c":2}]})"),
                        json::parse(R"({"b":[1,{"c":2}],"a":1})")));
  EXPECT_FALSE(JsonEqual(json::parse(R"({"a":1})"), json::parse(R"({"a":1,"b":2})")));
  EXPECT_FALSE(JsonEqual(json::parse(R"({"a":1})"), json::parse(R"({"b":1})")));
}

TEST(CompareOutputTest, TrueAcceptsAnyNonNull) {
  EXPECT_TRUE(CompareOutput(json(0), json(true)));
  EXPECT_TRUE(CompareOutput(json("x"), json(true)));
  EXPECT_TRUE(CompareOutput(json::array(), json(true)));
  EXPECT_TRUE(CompareOutput(json(false), json(true)));
  EXPECT_FALSE(CompareOutput(json(nullptr), json(true)));
  EXPECT_FALSE(CompareOutput(std::nullopt, json(true)));
}

TEST(CompareOutputTest, MissingActual) {
  EXPECT_FALSE(CompareOutput(std::nullopt, json(nullptr)));
  EXPECT_TRUE(CompareOutput(json(nullptr), json(nullptr)));
  EXPECT_TRUE(CompareOutput(json(false), json(false)));
}

TEST(ResultLineTest, LastNonEmptyLine) {
  EXPECT_EQ(ResultLine("a\nb\n").value_or(""), "b");
  EXPECT_EQ(ResultLine("debug\n{\"success\":true}\n\n  \n").value_or(""), "{\"success\":true}");
  EXPECT_EQ(ResultLine("  x  ").value_or(""), "x");
  EXPECT_EQ(ResultLine("\r\nonly\r\n").value_or(""), "only");
  EXPECT_FALSE(ResultLine(""));
  EXPECT_FALSE(ResultLine("\n \n\t\n"));
}

TEST(ParseExecutionResultTest, Passed) {
  auto test = MakeTestCase("t1", json::array({1, 2}), json::parse(R"({"x":[1,2]})"));
  auto res = ParseExecutionResult(
      Finished("log line\n{\"success\":true,\"result\":{\"x\":[1,2]}}\n"), test, 0);
  EXPECT_TRUE(res.passed);
  EXPECT_EQ(res.verdict, Verdict::PASSED);
  EXPECT_EQ(res.test_case_id, "t1");
  EXPECT_EQ(res.elapsed_ms, 12);
  ASSERT_TRUE(res.actual_output);
  EXPECT_EQ(*res.actual_output, json::parse(R"({"x":[1,2]})"));
  EXPECT_FALSE(res.error);
}

TEST(ParseExecutionResultTest, Mismatch) {
  auto test = MakeTestCase("t", json(1), json(2));
  auto res = ParseExecutionResult(Finished(R"({"success":true,"result":1})"), test, 0);
  EXPECT_FALSE(res.passed);
  EXPECT_EQ(res.verdict, Verdict::OUTPUT_MISMATCH);
  ASSERT_TRUE(res.actual_output);
  EXPECT_EQ(*res.actual_output, json(1));
}

TEST(ParseExecutionResultTest, Tolerance) {
  auto test = MakeTestCase("t", json(1), json(0.3));
  auto exec = Finished(R"({"success":true,"result":0.30000000000000004})");
  EXPECT_EQ(ParseExecutionResult(exec, test, 0).verdict, Verdict::OUTPUT_MISMATCH);
  EXPECT_EQ(ParseExecutionResult(exec, test, 1e-9).verdict, Verdict::PASSED);
}

TEST(ParseExecutionResultTest, MissingResultFailsAgainstNull) {
  auto test = MakeTestCase("t", json(1), json(nullptr));
  auto res = ParseExecutionResult(Finished(R"({"success":true})"), test, 0);
  EXPECT_EQ(res.verdict, Verdict::OUTPUT_MISMATCH);
  EXPECT_FALSE(res.actual_output);
}

TEST(ParseExecutionResultTest, CandidateError) {
  auto test = MakeTestCase("t", json(1), json(1));
  auto res = ParseExecutionResult(Finished(R"({"success":false,"error":"boom"})"), test, 0);
  EXPECT_FALSE(res.passed);
  EXPECT_EQ(res.verdict, Verdict::CANDIDATE_RUNTIME_ERROR);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "boom");

  res = ParseExecutionResult(Finished(R"({"success":false})"), test, 0);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Unknown error");

  res = ParseExecutionResult(Finished(R"({"success":false,"error":{"code":7}})"), test, 0);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, R"({"code":7})");
}

class MalformedOutputTest : public testing::TestWithParam<std::string> {};
TEST_P(MalformedOutputTest, Malformed) {
  auto test = MakeTestCase("t", json(1), json(1));
  auto res = ParseExecutionResult(Finished(GetParam()), test, 0);
  EXPECT_FALSE(res.passed);
  EXPECT_EQ(res.verdict, Verdict::MALFORMED_OUTPUT);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Failed to parse execution output");
  ASSERT_TRUE(res.actual_output);
  EXPECT_EQ(*res.actual_output, json(GetParam()));
}
INSTANTIATE_TEST_SUITE_P(Output, MalformedOutputTest,
    testing::Values("", "\n\n", "hello", "{\"success\":true", "[1,2]", "{\"result\":1}",
                    "{\"success\":\"yes\"}", "{\"success\":true}\ntrailing"));

TEST(ParseExecutionResultTest, FailedRun) {
  auto test = MakeTestCase("t", json(1), json(1));
  ExecutionResult exec;
  exec.exit_code = 1;
  exec.stderr_str = "  Traceback  \n";
  auto res = ParseExecutionResult(exec, test, 0);
  EXPECT_EQ(res.verdict, Verdict::RUN_FAILED);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Traceback");

  exec.timed_out = true;
  exec.error = "Execution timed out";
  res = ParseExecutionResult(exec, test, 0);
  EXPECT_EQ(res.verdict, Verdict::TIMED_OUT);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Execution timed out");

  exec.timed_out = false;
  exec.cancelled = true;
  exec.error = "Execution cancelled";
  EXPECT_EQ(ParseExecutionResult(exec, test, 0).verdict, Verdict::CANCELLED);
}
