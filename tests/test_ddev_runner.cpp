// ---------------------------------------------------------------------------
// test_ddev_runner.cpp
//
// DdevRunner 프로세스 실행 테스트. ddev 대신 /bin/sh 를 실행 파일로 지정한다.
//
// [테스트 범위]
// - stdout 수집
// - 종료 코드 != 0 → kNonZeroExit, 메시지는 stderr 우선
// - 실행 파일 없음 → kNotFound
// - 타임아웃 → kTimeout
// ---------------------------------------------------------------------------

#include "db/ddev_runner.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

DdevConfig sh_config(std::uint32_t timeout_sec = 10) {
    DdevConfig cfg{};
    cfg.binary              = "sh";
    cfg.project_dir         = ".";
    cfg.command_timeout_sec = timeout_sec;
    return cfg;
}

}  // namespace

TEST(DdevRunner, CollectsStdout) {
    DdevRunner runner(sh_config());

    const auto result = runner.run({"-c", "echo hello; echo world"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, "hello\nworld\n");
}

TEST(DdevRunner, NonZeroExitPrefersStderr) {
    DdevRunner runner(sh_config());

    const auto result = runner.run({"-c", "echo partial; echo 'boom' 1>&2; exit 3"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, CommandErrorCode::kNonZeroExit);
    EXPECT_EQ(result.error().exit_code, 3);
    EXPECT_EQ(result.error().message, "boom");
    EXPECT_EQ(result.error().context.rfind("sh -c", 0), 0u);
}

TEST(DdevRunner, NonZeroExitFallsBackToStdout) {
    DdevRunner runner(sh_config());

    const auto result = runner.run({"-c", "echo only-stdout; exit 1"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "only-stdout");
}

TEST(DdevRunner, NonZeroExitWithoutOutput) {
    DdevRunner runner(sh_config());

    const auto result = runner.run({"-c", "exit 7"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "exit code 7");
}

TEST(DdevRunner, MissingBinaryReportsNotFound) {
    DdevConfig cfg = sh_config();
    cfg.binary = "querygate-no-such-binary";
    DdevRunner runner(cfg);

    const auto result = runner.run({"exec", "mysql"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, CommandErrorCode::kNotFound);
}

TEST(DdevRunner, MissingAbsolutePathReportsNotFound) {
    DdevConfig cfg = sh_config();
    cfg.binary = "/nonexistent/querygate/ddev";
    DdevRunner runner(cfg);

    const auto result = runner.run({"version"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, CommandErrorCode::kNotFound);
}

TEST(DdevRunner, TimeoutTerminatesChild) {
    DdevRunner runner(sh_config(1));

    const auto result = runner.run({"-c", "exec sleep 10"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, CommandErrorCode::kTimeout);
}

TEST(DdevRunner, StdinIsClosed) {
    DdevRunner runner(sh_config());

    // stdin 이 닫혀 있으므로 cat 은 즉시 EOF 를 만나 종료한다
    const auto result = runner.run({"-c", "cat; echo done"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, "done\n");
}
