/*
 * 설명: 오류 분류의 문자열 표현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "scheduler/engine_error.hpp"

namespace scheduler {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kCapacity:
      return "capacity";
    case ErrorKind::kConcurrency:
      return "concurrency";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

}  // namespace scheduler
