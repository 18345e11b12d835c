#pragma once

// ---------------------------------------------------------------------------
// ddev_runner.hpp
//
// Boost.Process 로 ddev CLI 를 실행하는 CommandRunner 구현.
//
// [동작]
// - binary 가 '/' 를 포함하지 않으면 PATH 에서 찾는다.
// - project_dir 에서 실행하고 stdin 은 닫는다 (대화형 프롬프트 차단).
// - stdout/stderr 는 run() 호출마다 새 io_context 위에서 비동기로 수집한다.
// - command_timeout_sec 초과 시 자식 프로세스를 종료하고 kTimeout 반환.
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <string>
#include <vector>

#include "config/gateway_config.hpp"  // DdevConfig
#include "db/command_runner.hpp"

class DdevRunner final : public CommandRunner {
public:
    explicit DdevRunner(DdevConfig config);

    [[nodiscard]] std::expected<std::string, CommandError>
    run(const std::vector<std::string>& args) override;

    [[nodiscard]] const DdevConfig& config() const noexcept { return config_; }

private:
    // 커맨드 라인 문자열 (로그/오류 context 용)
    [[nodiscard]] std::string describe(const std::vector<std::string>& args) const;

    DdevConfig                config_;
    std::chrono::seconds      timeout_;
};
