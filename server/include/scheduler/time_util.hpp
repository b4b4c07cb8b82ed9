/*
 * 설명: UTC 타임스탬프의 ISO-8601/DB 문자열 변환과 밀리초 정규화를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/time_util_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "scheduler/model.hpp"

namespace scheduler {

// 저장/비교 전에 모든 시각을 밀리초 단위로 절삭한다.
Timestamp TruncateToMillis(Timestamp tp);

// "2024-12-01T09:00:00Z", "2024-12-01T09:00:00.250Z", "2024-12-01T18:00:00.000+09:00" 형식을 받는다.
std::optional<Timestamp> ParseIsoTimestamp(std::string_view text);

// "2024-12-01" 을 로컬 달력 기준 자정으로 해석한다.
std::optional<Timestamp> ParseLocalDate(std::string_view text);

std::string ToIsoString(Timestamp tp);

// MariaDB DATETIME(3) 문자열, UTC 기준.
std::string ToSqlDateTime(Timestamp tp);
std::optional<Timestamp> ParseSqlDateTime(std::string_view text);

}  // namespace scheduler
