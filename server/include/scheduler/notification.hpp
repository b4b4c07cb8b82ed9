/*
 * 설명: 대기열 배정/승격 알림을 외부 알림 협력자에게 넘기는 싱크를 정의한다.
 *       전달 실패는 예약 트랜잭션을 되돌리지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "scheduler/capacity.hpp"
#include "scheduler/db_client.hpp"

namespace scheduler {

class NotificationSink {
 public:
  virtual ~NotificationSink() = default;
  virtual void Publish(const NotificationEvent& event) = 0;
};

std::string BuildNotificationMessage(const NotificationEvent& event);

// notification_logs 테이블에 pending 상태로 적재한다. 실제 발송은 외부 워커 몫이다.
class NotificationLogSink : public NotificationSink {
 public:
  explicit NotificationLogSink(std::shared_ptr<MariaDbClient> db_client);

  void Publish(const NotificationEvent& event) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace scheduler
