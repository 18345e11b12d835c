#pragma once

// ---------------------------------------------------------------------------
// command_runner.hpp
//
// 외부 CLI 실행 경계. QueryService 는 이 인터페이스만 알고, 실제 프로세스
// 생성은 DdevRunner 가 담당한다. 테스트는 가짜 러너를 주입한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <vector>

#include "common/types.hpp"  // CommandError

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // run
    //   args: 실행 파일 이름을 제외한 인자 목록 (예: {"exec", "mysql", "-e", "..."})
    //   성공 시 stdout 전체, 실패 시 CommandError.
    [[nodiscard]] virtual std::expected<std::string, CommandError>
    run(const std::vector<std::string>& args) = 0;
};
