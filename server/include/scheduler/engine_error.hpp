/*
 * 설명: 예약 엔진의 오류 분류와 호출자에게 돌려줄 결과 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/booking_validation_test.cpp, server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace scheduler {

enum class ErrorKind { kValidation, kCapacity, kConcurrency, kNotFound, kInternal };

std::string_view ToString(ErrorKind kind);

class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, std::string code, const std::string& message)
      : std::runtime_error(message), kind(kind), code(std::move(code)) {}
  ErrorKind kind;
  std::string code;
};

struct BookingError {
  ErrorKind kind{ErrorKind::kInternal};
  std::string code;
  std::string message;
  // 실패가 발생한 오케스트레이터 단계: classify, validate, availability, quota, write.
  std::string step;
  bool retryable{false};
};

template <typename T>
struct Outcome {
  std::optional<T> value;
  std::optional<BookingError> error;

  bool ok() const { return value.has_value(); }

  static Outcome Success(T result) {
    Outcome outcome;
    outcome.value = std::move(result);
    return outcome;
  }

  static Outcome Failure(BookingError failure) {
    Outcome outcome;
    outcome.error = std::move(failure);
    return outcome;
  }
};

}  // namespace scheduler
