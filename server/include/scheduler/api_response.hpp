/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace scheduler {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail에는 오류 분류(kind), 실패 단계(step), 재시도 가능 여부(retryable)를 담는다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

}  // namespace scheduler
