#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드하여 GatewayConfig 로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로 파싱된
//   설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// config_loader.hpp → gateway_config.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "gateway_config.hpp"  // GatewayConfig

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   실패 조건: 경로 해석 불가, 파일 열기 실패, YAML 문법 오류,
    //   최상위가 map 이 아님, 알 수 없는 database.type, 잘못된 command_timeout.
    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load(const std::filesystem::path& config_path);

    // parse_timeout
    //   "30s" 또는 "30" → 30. 0, 음수, 숫자 없음, "s" 외의 단위는 std::nullopt.
    [[nodiscard]] static std::optional<std::uint32_t> parse_timeout(const std::string& raw);
};
