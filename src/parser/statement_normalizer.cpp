// ---------------------------------------------------------------------------
// statement_normalizer.cpp
//
// SQL 정규화 구현.
//
// [주석 제거 규칙]
// 1. /* ... */ 블록 주석 (비탐욕, 여러 줄) → 공백 하나.
//    닫히지 않은 "/*" 는 주석이 아니므로 원문 그대로 남긴다.
//    그 뒤 텍스트가 whitelist 에 걸리지 않아 결과적으로 차단된다.
// 2. -- 라인 주석 (줄 끝까지, 개행은 보존) → 공백 하나.
//
// 주석 자리에 공백을 넣으므로 DROP/**/DATABASE 는 "DROP DATABASE" 가 되어
// catastrophic 규칙에 그대로 매칭된다.
//
// [조건부 실행 주석 탐지]
// 주석 제거와 별도로 원문 전체에서 "/*!" 와 "/*M!" 를 찾는다. 리터럴이나
// 다른 주석 안에 있어도 플래그를 세운다.
// ---------------------------------------------------------------------------

#include "parser/statement_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// 원문 어딘가에 "/*!" 또는 "/*M!" (대소문자 무관) 가 있는지
bool contains_executable_comment(std::string_view sql) {
    for (auto pos = sql.find("/*"); pos != std::string_view::npos; pos = sql.find("/*", pos + 2)) {
        const auto body = sql.substr(pos + 2);
        if (body.starts_with('!')) {
            return true;
        }
        if (body.size() >= 2 && (body[0] == 'M' || body[0] == 'm') && body[1] == '!') {
            return true;
        }
    }
    return false;
}

// 1단계: 블록 주석 제거.
std::string strip_block_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();

    while (i < len) {
        if (i + 1 < len && sql[i] == '/' && sql[i + 1] == '*') {
            const auto close = sql.find("*/", i + 2);
            if (close == std::string_view::npos) {
                // 닫히지 않은 주석: 이후에 닫는 "*/" 가 없으므로 나머지를 그대로 복사
                result.append(sql.substr(i));
                break;
            }
            result.push_back(' ');
            i = close + 2;
            continue;
        }
        result.push_back(sql[i]);
        ++i;
    }

    return result;
}

// 2단계: -- 라인 주석 제거. 줄 끝 문자(\n, \r)는 남긴다.
std::string strip_line_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();

    while (i < len) {
        if (i + 1 < len && sql[i] == '-' && sql[i + 1] == '-') {
            while (i < len && sql[i] != '\n' && sql[i] != '\r') {
                ++i;
            }
            result.push_back(' ');
            continue;
        }
        result.push_back(sql[i]);
        ++i;
    }

    return result;
}

// 3~4단계: 공백 연속을 스페이스 하나로 축약하고 앞뒤를 잘라낸다.
std::string collapse_whitespace(std::string_view s) {
    std::string result;
    result.reserve(s.size());

    bool pending_space = false;
    for (const char c : s) {
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !result.empty()) {
            result.push_back(' ');
        }
        pending_space = false;
        result.push_back(c);
    }

    return result;
}

std::string_view trim(std::string_view s) {
    const auto not_space = [](char c) { return !is_space(c); };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

std::string strip_comments(std::string_view sql) {
    return strip_line_comments(strip_block_comments(sql));
}

// ';' 로 분할하여 trim 후 비어 있지 않은 조각 수를 센다.
// strip_parts 가 true 면 조각마다 주석을 제거한 뒤 판단한다.
std::size_t count_statements(std::string_view s, bool strip_parts) {
    std::size_t count = 0;
    std::size_t start = 0;
    while (start <= s.size()) {
        const auto semi = s.find(';', start);
        const auto part = (semi == std::string_view::npos)
            ? s.substr(start)
            : s.substr(start, semi - start);
        const bool non_empty = strip_parts
            ? !trim(strip_comments(part)).empty()
            : !trim(part).empty();
        if (non_empty) {
            ++count;
        }
        if (semi == std::string_view::npos) {
            break;
        }
        start = semi + 1;
    }
    return count;
}

void to_upper_ascii(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
}

}  // namespace

NormalizedStatement normalize_statement(std::string_view sql) {
    NormalizedStatement out;

    out.has_executable_comment = contains_executable_comment(sql);

    out.text = collapse_whitespace(strip_comments(sql));

    // 대문자 변환은 ';' 와 공백에 영향을 주지 않으므로 구문 개수는
    // 변환 전/후 어느 쪽에서 세어도 같다.
    out.statement_count = count_statements(out.text, false);
    to_upper_ascii(out.text);

    out.raw_text = collapse_whitespace(sql);
    out.raw_statement_count = count_statements(sql, true);
    to_upper_ascii(out.raw_text);

    return out;
}
