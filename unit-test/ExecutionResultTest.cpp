#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "runner/execution_result.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace ptyrun;
using namespace nlohmann;

TEST(ExecutionResultTest, CompilationFailedKeepsFirstCharacters) {
    string log(600, 'e');
    log.replace(0, 5, "main:");
    auto result = make_compilation_failed(log);
    ASSERT_TRUE(holds_alternative<compilation_failed>(result));
    auto &failed = get<compilation_failed>(result);
    EXPECT_EQ(500u, failed.error_excerpt.size());
    EXPECT_EQ("main:", failed.error_excerpt.substr(0, 5));
}

TEST(ExecutionResultTest, RunCompletedKeepsLastCharacters) {
    string transcript = string(1000, 'a') + "tail";
    auto result = make_run_completed(transcript, 0, status::COMPLETED);
    auto &run = get<run_completed>(result);
    EXPECT_EQ(1000u, run.transcript_excerpt.size());
    EXPECT_EQ("tail", run.transcript_excerpt.substr(996));
}

TEST(ExecutionResultTest, InvalidOutputBecomesValidExcerpt) {
    string transcript = "ok" + string(3000, '\x80');
    auto result = make_run_completed(transcript, 0, status::COMPLETED);
    auto &run = get<run_completed>(result);
    EXPECT_TRUE(utf8_check_is_valid(run.transcript_excerpt));
    EXPECT_EQ(1000u, utf8_length(run.transcript_excerpt));
    EXPECT_NO_THROW(result_to_json(result).dump());
}

TEST(ExecutionResultTest, Describe) {
    EXPECT_EQ("Completed (exit code 3)", describe(make_run_completed("", 3, status::COMPLETED)));
    EXPECT_EQ("Terminated by Timeout (exit code 143)", describe(make_run_completed("", 143, status::TERMINATED_BY_TIMEOUT)));
    EXPECT_EQ("Unsupported file type", describe(unsupported_file{}));
    EXPECT_EQ("System error: no pty", describe(make_system_failure("no pty")));
}

TEST(ExecutionResultTest, Json) {
    EXPECT_JSON_EQ(result_to_json(make_compilation_failed("a.cpp:1: error")),
                   json({{"type", "compilation_failed"}, {"error_excerpt", "a.cpp:1: error"}}));
    EXPECT_JSON_EQ(result_to_json(unsupported_file{}),
                   json({{"type", "unsupported_file"}}));
    EXPECT_JSON_EQ(result_to_json(make_run_completed("hi\n", FORCE_KILLED_EXIT_CODE, status::FORCIBLY_KILLED)),
                   json({{"type", "completed"}, {"transcript_excerpt", "hi\n"}, {"exit_code", -1}, {"status", "forcibly_killed"}}));
    EXPECT_JSON_EQ(result_to_json(make_run_completed("", 130, status::TERMINATED_BY_INTERRUPT)),
                   json({{"type", "completed"}, {"transcript_excerpt", ""}, {"exit_code", 130}, {"status", "terminated_by_interrupt"}}));
    EXPECT_JSON_EQ(result_to_json(make_system_failure("fork failed")),
                   json({{"type", "system_error"}, {"message", "fork failed"}}));
}
