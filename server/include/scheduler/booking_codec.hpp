/*
 * 설명: REST 본문(JSON)과 예약 요청/결과 타입 사이의 변환, 오류 분류별 HTTP 상태 매핑을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/booking_codec_test.cpp
 */
#pragma once

#include <nlohmann/json.hpp>

#include "scheduler/booking_service.hpp"
#include "scheduler/engine_error.hpp"

namespace scheduler {

// 형식 오류는 EngineError(kValidation)로 던진다. 알 수 없는 sessionType 은 unknown_session_type.
BookingRequest ParseBookingRequest(const nlohmann::json& body);
ParticipantRequest ParseParticipantRequest(const nlohmann::json& body);
BookingStatus ParseBookingStatusField(const nlohmann::json& body);
SessionStatus ParseSessionStatusField(const nlohmann::json& body);
int ParseMaxParticipantsField(const nlohmann::json& body);

nlohmann::json ToJson(const BookingConfirmation& confirmation);
nlohmann::json ToJson(const StatusChange& change);
nlohmann::json ToJson(const SessionLedger& ledger);
nlohmann::json ToJson(const ReconcileReport& report);

unsigned int HttpStatusFor(ErrorKind kind);

}  // namespace scheduler
