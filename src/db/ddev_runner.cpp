// ---------------------------------------------------------------------------
// ddev_runner.cpp
//
// Boost.Process(v1) + Boost.Asio 기반 ddev CLI 실행기.
//
// [타임아웃 처리]
// io_context::run_for(timeout) 가 반환했을 때 io_context 가 stopped 상태가
// 아니면 stdout/stderr 파이프가 아직 열려 있다는 뜻이므로 자식 프로세스를
// 종료한다. 남은 비동기 핸들러는 io_context 소멸 시 함께 정리된다.
// ---------------------------------------------------------------------------

#include "db/ddev_runner.hpp"

#include <exception>
#include <future>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

namespace bp = boost::process;

namespace {

// 앞뒤 공백 제거 (오류 메시지용)
std::string trim_copy(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

boost::filesystem::path resolve_binary(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return boost::filesystem::path{binary};
    }
    return bp::search_path(binary);
}

}  // namespace

DdevRunner::DdevRunner(DdevConfig config)
    : config_(std::move(config))
    , timeout_(config_.command_timeout_sec > 0 ? config_.command_timeout_sec : 30)
{}

std::string DdevRunner::describe(const std::vector<std::string>& args) const {
    std::string line = config_.binary;
    for (const auto& arg : args) {
        line += ' ';
        line += arg;
    }
    return line;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
std::expected<std::string, CommandError>
DdevRunner::run(const std::vector<std::string>& args) {
    const std::string cmdline = describe(args);

    // 1. 실행 파일 해석
    const boost::filesystem::path exe = resolve_binary(config_.binary);
    boost::system::error_code exists_ec;
    if (exe.empty() || !boost::filesystem::exists(exe, exists_ec)) {
        spdlog::error("ddev_runner: executable '{}' not found", config_.binary);
        return std::unexpected(CommandError{
            CommandErrorCode::kNotFound,
            fmt::format("'{}' not found in PATH", config_.binary),
            cmdline,
        });
    }

    spdlog::debug("ddev_runner: running '{}' in '{}'", cmdline, config_.project_dir);

    // 2. 프로세스 생성 (stdout/stderr 는 future 로 비동기 수집)
    boost::asio::io_context  ioc;
    std::future<std::string> out_future;
    std::future<std::string> err_future;
    std::error_code          spawn_ec;

    bp::child child(exe,
                    bp::args(args),
                    bp::start_dir(config_.project_dir),
                    bp::std_in.close(),
                    bp::std_out > out_future,
                    bp::std_err > err_future,
                    ioc,
                    spawn_ec);

    if (spawn_ec) {
        spdlog::error("ddev_runner: failed to start '{}': {}", cmdline, spawn_ec.message());
        return std::unexpected(CommandError{
            CommandErrorCode::kSpawnFailed,
            fmt::format("failed to start '{}': {}", config_.binary, spawn_ec.message()),
            cmdline,
        });
    }

    // 3. 출력 수집 (타임아웃 포함)
    ioc.run_for(timeout_);
    if (!ioc.stopped()) {
        std::error_code term_ec;
        child.terminate(term_ec);
        spdlog::warn("ddev_runner: '{}' timed out after {}s, child terminated",
                     cmdline, timeout_.count());
        return std::unexpected(CommandError{
            CommandErrorCode::kTimeout,
            fmt::format("command timed out after {}s", timeout_.count()),
            cmdline,
        });
    }

    std::error_code wait_ec;
    child.wait(wait_ec);
    if (wait_ec) {
        spdlog::error("ddev_runner: wait failed for '{}': {}", cmdline, wait_ec.message());
        return std::unexpected(CommandError{
            CommandErrorCode::kSpawnFailed,
            fmt::format("failed to wait for '{}': {}", config_.binary, wait_ec.message()),
            cmdline,
        });
    }

    std::string out;
    std::string err;
    try {
        out = out_future.get();
        err = err_future.get();
    } catch (const std::exception& e) {
        // 파이프 읽기 오류(std::system_error) 또는 std::future_error
        spdlog::error("ddev_runner: reading output of '{}' failed: {}", cmdline, e.what());
        return std::unexpected(CommandError{
            CommandErrorCode::kSpawnFailed,
            fmt::format("failed to read output: {}", e.what()),
            cmdline,
        });
    }

    // 4. 종료 코드 매핑
    const int exit_code = child.exit_code();
    if (exit_code != 0) {
        std::string message = trim_copy(err);
        if (message.empty()) {
            message = trim_copy(out);
        }
        if (message.empty()) {
            message = fmt::format("exit code {}", exit_code);
        }
        spdlog::warn("ddev_runner: '{}' exited with {}", cmdline, exit_code);
        return std::unexpected(CommandError{
            CommandErrorCode::kNonZeroExit,
            std::move(message),
            cmdline,
            exit_code,
        });
    }

    return out;
}
