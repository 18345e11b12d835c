// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GatewayConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다. 기본값은 read-only 모드.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - command_timeout: "30s" 형태에서 숫자만 추출한다. 단위는 "s" 만 허용.
// - extra_catastrophic_patterns 의 잘못된 regex 는 로드 실패가 아니라
//   경고로 처리된다. QueryClassifier 가 해당 패턴을 건너뛰므로 운영자가
//   로그를 확인해야 한다 (false negative 위험).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <charconv>
#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 추가 차단 패턴 사전 검증 (경고만)
// ---------------------------------------------------------------------------
void validate_extra_patterns(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::ECMAScript);
            (void)re;
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "config_loader: extra_catastrophic_pattern '{}' is invalid regex and will be "
                "skipped by the classifier: {}",
                p, e.what()
            );
        }
    }
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not a boolean, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level = read_string(node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(node["log_path"],  cfg.log_path);
    return cfg;
}

[[nodiscard]] SecurityConfig parse_security(const YAML::Node& node) {
    SecurityConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.allow_write                 = read_bool(node["allow_write"], cfg.allow_write);
    cfg.extra_catastrophic_patterns = read_string_sequence(node["extra_catastrophic_patterns"]);
    return cfg;
}

[[nodiscard]] std::expected<DatabaseConfig, std::string>
parse_database(const YAML::Node& node) {
    DatabaseConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    const std::string type_str = read_string(node["type"], "");
    const auto type = parse_database_type(type_str);
    if (!type) {
        return std::unexpected(fmt::format(
            "config_loader: unknown database.type '{}' (expected mysql, mariadb or postgres)",
            type_str));
    }
    cfg.type = *type;
    cfg.name = read_string(node["name"], cfg.name);
    return cfg;
}

[[nodiscard]] std::expected<DdevConfig, std::string>
parse_ddev(const YAML::Node& node) {
    DdevConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.binary      = read_string(node["binary"],      cfg.binary);
    cfg.project_dir = read_string(node["project_dir"], cfg.project_dir);

    if (node["command_timeout"] && node["command_timeout"].IsScalar()) {
        const std::string raw = node["command_timeout"].as<std::string>();
        const auto timeout = ConfigLoader::parse_timeout(raw);
        if (!timeout) {
            return std::unexpected(fmt::format(
                "config_loader: invalid ddev.command_timeout '{}' (expected e.g. \"30s\")", raw));
        }
        cfg.command_timeout_sec = *timeout;
    }

    if (cfg.binary.empty()) {
        return std::unexpected(std::string("config_loader: ddev.binary must not be empty"));
    }
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::parse_timeout
// ---------------------------------------------------------------------------
std::optional<std::uint32_t> ConfigLoader::parse_timeout(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::uint32_t value{0};
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || value == 0) {
        return std::nullopt;
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    if (!unit.empty() && unit != "s") {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<GatewayConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션별 파싱
    GatewayConfig cfg{};

    try {
        cfg.global   = parse_global(root["global"]);
        cfg.security = parse_security(root["security"]);

        auto database = parse_database(root["database"]);
        if (!database) {
            spdlog::error("{}", database.error());
            return std::unexpected(database.error());
        }
        cfg.database = std::move(*database);

        auto ddev = parse_ddev(root["ddev"]);
        if (!ddev) {
            spdlog::error("{}", ddev.error());
            return std::unexpected(ddev.error());
        }
        cfg.ddev = std::move(*ddev);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}': {}", canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 4. 추가 차단 패턴 사전 검증 (경고만)
    validate_extra_patterns(cfg.security.extra_catastrophic_patterns);

    spdlog::info(
        "config_loader: config loaded: allow_write={}, database={}, extra_patterns={}",
        cfg.security.allow_write,
        database_type_name(cfg.database.type),
        cfg.security.extra_catastrophic_patterns.size()
    );

    return cfg;
}
