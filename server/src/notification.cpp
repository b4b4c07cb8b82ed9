/*
 * 설명: 알림 메시지 생성과 notification_logs 적재를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/booking_it_test.cpp
 */
#include "scheduler/notification.hpp"

#include <sstream>

namespace scheduler {

std::string BuildNotificationMessage(const NotificationEvent& event) {
  if (event.type == NotificationType::kWaitlistPromoted) {
    return "Great news! A spot opened up in your training session. You have been moved from the waitlist to "
           "confirmed.";
  }
  std::ostringstream oss;
  oss << "Your training session is full. You have been added to the waitlist at position " << event.position.value_or(0)
      << ".";
  return oss.str();
}

NotificationLogSink::NotificationLogSink(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void NotificationLogSink::Publish(const NotificationEvent& event) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO notification_logs(session_id, member_id, participant_id, notification_type, channel, "
           "message_content, status) VALUES("
        << event.session_id << ", " << (event.member_id ? std::to_string(*event.member_id) : std::string{"NULL"})
        << ", " << event.participant_id << ", '" << ToString(event.type) << "', 'sms', '"
        << db_client_->Escape(conn, BuildNotificationMessage(event)) << "', 'pending');";
    db_client_->Execute(conn, oss.str(), "알림 로그 저장 실패");
  });
}

}  // namespace scheduler
