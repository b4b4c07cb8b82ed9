/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "scheduler/api_response.hpp"

#include <chrono>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
std::string CurrentTimestamp() { return ToIsoString(std::chrono::system_clock::now()); }
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

}  // namespace scheduler
