/*
 * 설명: HTTP 요청을 처리하고 예약/세션/가용성/주간 한도/운영 경로로 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#include "scheduler/http_session.hpp"

#include <charconv>
#include <chrono>
#include <optional>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "scheduler/booking_codec.hpp"
#include "scheduler/time_util.hpp"

namespace scheduler {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string PercentDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      decoded.push_back(value[i]);
    }
  }
  return decoded;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::int64_t> ParseInteger(const std::string& value) {
  std::int64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

BookingError RequestError(const EngineError& ex) {
  return BookingError{ex.kind, ex.code, ex.what(), ex.code == "unknown_session_type" ? "classify" : "validate",
                      false};
}

BookingError RouteNotFound() {
  return BookingError{ErrorKind::kNotFound, "not_found", "지원되지 않는 경로입니다", "classify", false};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<BookingService> booking_service,
                         std::shared_ptr<AvailabilityChecker> availability, std::shared_ptr<WeeklyQuotaChecker> quota,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), booking_service_(std::move(booking_service)),
      availability_(std::move(availability)), quota_(std::move(quota)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "studio-scheduler");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Route(path, query, *res);
  } catch (const nlohmann::json::exception&) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const EngineError& ex) {
    WriteError(*res, RequestError(ex));
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Warn("http.unhandled", {{"target", target_str}, {"error", ex.what()}});
    }
    WriteJson(*res, http::status::internal_server_error,
              MakeErrorEnvelope("internal_error", "요청 처리 중 오류가 발생했습니다"));
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, const std::string& query, Response& res) {
  using namespace boost::beast;
  auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"bookings",
                         {{"confirmed", snapshot.bookings_confirmed},
                          {"waitlisted", snapshot.bookings_waitlisted},
                          {"promotions", snapshot.promotions}}},
                        {"availability",
                         {{"conflictAdvisories", snapshot.conflict_advisories},
                          {"degradedChecks", snapshot.degraded_checks}}},
                        {"reconcile", {{"repairs", snapshot.reconcile_repairs}}}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::post && path == "/ops/reconcile") {
    return HandleReconcile(res);
  }

  if (method == http::verb::post && path == "/api/bookings") {
    auto request = ParseBookingRequest(nlohmann::json::parse(req_.body()));
    auto outcome = booking_service_->CreateBooking(request);
    if (!outcome.ok()) {
      return WriteError(res, *outcome.error);
    }
    return WriteJson(res, http::status::created, MakeSuccessEnvelope(ToJson(*outcome.value)));
  }

  if (method == http::verb::get && path == "/api/availability") {
    return HandleAvailability(query, res);
  }

  if (method == http::verb::get && path == "/api/quota") {
    return HandleQuota(query, res);
  }

  auto segments = SplitPath(path);
  if (segments.size() >= 3 && segments[0] == "api" && segments[1] == "sessions") {
    auto session_id = ParseInteger(segments[2]);
    if (!session_id || *session_id <= 0) {
      return WriteError(res, BookingError{ErrorKind::kValidation, "invalid_field", "세션 id가 올바르지 않습니다",
                                          "validate", false});
    }
    return RouteSession(*session_id, segments, res);
  }

  WriteError(res, RouteNotFound());
}

void HttpSession::RouteSession(std::int64_t session_id, const std::vector<std::string>& segments, Response& res) {
  using namespace boost::beast;
  auto method = req_.method();
  auto reply_change = [&](const Outcome<StatusChange>& outcome, http::status ok_status) {
    if (!outcome.ok()) {
      return WriteError(res, *outcome.error);
    }
    WriteJson(res, ok_status, MakeSuccessEnvelope(ToJson(*outcome.value)));
  };
  auto parse_sub_id = [&](const std::string& text) {
    auto id = ParseInteger(text);
    if (!id || *id <= 0) {
      throw EngineError(ErrorKind::kValidation, "invalid_field", "경로의 id가 올바르지 않습니다: " + text);
    }
    return *id;
  };

  if (segments.size() == 3) {
    if (method == http::verb::get) {
      auto outcome = booking_service_->GetSession(session_id);
      if (!outcome.ok()) {
        return WriteError(res, *outcome.error);
      }
      return WriteJson(res, http::status::ok, MakeSuccessEnvelope(ToJson(*outcome.value)));
    }
    if (method == http::verb::delete_) {
      auto outcome = booking_service_->DeleteSession(session_id);
      if (!outcome.ok()) {
        return WriteError(res, *outcome.error);
      }
      return WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"deleted", true}, {"sessionId", session_id}}));
    }
    return WriteError(res, RouteNotFound());
  }

  const auto& resource = segments[3];
  if (segments.size() == 4 && method == http::verb::post && resource == "participants") {
    auto request = ParseParticipantRequest(nlohmann::json::parse(req_.body()));
    return reply_change(booking_service_->AddParticipant(session_id, request), http::status::created);
  }
  if (segments.size() == 5 && method == http::verb::patch && resource == "participants") {
    auto member_id = parse_sub_id(segments[4]);
    auto status = ParseBookingStatusField(nlohmann::json::parse(req_.body()));
    return reply_change(booking_service_->UpdateParticipantStatus(session_id, member_id, status), http::status::ok);
  }
  if (segments.size() == 5 && method == http::verb::patch && resource == "bookings") {
    auto participant_id = parse_sub_id(segments[4]);
    auto status = ParseBookingStatusField(nlohmann::json::parse(req_.body()));
    return reply_change(booking_service_->UpdateParticipantStatusById(session_id, participant_id, status),
                        http::status::ok);
  }
  if (segments.size() == 5 && method == http::verb::delete_ && resource == "waitlist") {
    auto participant_id = parse_sub_id(segments[4]);
    return reply_change(booking_service_->RemoveFromWaitlist(session_id, participant_id), http::status::ok);
  }
  if (segments.size() == 4 && method == http::verb::patch && resource == "capacity") {
    auto max_participants = ParseMaxParticipantsField(nlohmann::json::parse(req_.body()));
    return reply_change(booking_service_->UpdateSessionCapacity(session_id, max_participants), http::status::ok);
  }
  if (segments.size() == 4 && method == http::verb::patch && resource == "status") {
    auto status = ParseSessionStatusField(nlohmann::json::parse(req_.body()));
    auto outcome = booking_service_->UpdateSessionStatus(session_id, status);
    if (!outcome.ok()) {
      return WriteError(res, *outcome.error);
    }
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(ToJson(*outcome.value)));
  }
  WriteError(res, RouteNotFound());
}

void HttpSession::HandleAvailability(const std::string& query, Response& res) {
  auto params = ParseQueryParams(query);
  auto field = [&](const char* key) -> std::string {
    auto it = params.find(key);
    return it == params.end() ? std::string{} : it->second;
  };

  // 리소스 유형은 닫힌 열거형이므로 알 수 없는 값은 요청 오류로 돌려준다.
  auto kind = ParseResourceKind(field("resourceType"));
  if (!kind) {
    throw EngineError(ErrorKind::kValidation, "invalid_resource_type", "resourceType 은 trainer 또는 machine 이어야 합니다");
  }
  auto reply = [&](const AvailabilityResult& result) {
    WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(result)));
  };

  auto resource_id = ParseInteger(field("resourceId"));
  if (!resource_id) {
    return reply(
        availability_->Degrade(ResourceRef{*kind, 0}, "resourceId 를 해석할 수 없습니다: " + field("resourceId")));
  }
  ResourceRef resource{*kind, *resource_id};
  auto start = ParseIsoTimestamp(field("start"));
  auto end = ParseIsoTimestamp(field("end"));
  if (!start || !end) {
    return reply(availability_->Degrade(resource, "start/end 를 ISO-8601 시각으로 해석할 수 없습니다"));
  }
  std::optional<std::int64_t> exclude;
  auto exclude_text = field("excludeSessionId");
  if (!exclude_text.empty()) {
    exclude = ParseInteger(exclude_text);
    if (!exclude) {
      return reply(availability_->Degrade(resource, "excludeSessionId 를 해석할 수 없습니다: " + exclude_text));
    }
  }

  reply(availability_->Check(resource, *start, *end, exclude));
}

void HttpSession::HandleQuota(const std::string& query, Response& res) {
  auto params = ParseQueryParams(query);
  Timestamp date = std::chrono::system_clock::now();
  auto it = params.find("date");
  if (it != params.end() && !it->second.empty()) {
    auto parsed = ParseLocalDate(it->second);
    if (!parsed) {
      parsed = ParseIsoTimestamp(it->second);
    }
    if (!parsed) {
      throw EngineError(ErrorKind::kValidation, "invalid_timestamp", "date 는 YYYY-MM-DD 또는 ISO-8601 이어야 합니다");
    }
    date = *parsed;
  }
  try {
    auto status = quota_->CheckStudioQuota(date);
    WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(status)));
  } catch (const DbException& ex) {
    WriteError(res, BookingError{ex.retryable ? ErrorKind::kConcurrency : ErrorKind::kInternal,
                                 ex.retryable ? "transaction_conflict" : "store_failure", ex.what(), "quota",
                                 ex.retryable});
  }
}

void HttpSession::HandleReconcile(Response& res) {
  if (!HasOpsToken()) {
    return WriteJson(res, boost::beast::http::status::unauthorized,
                     MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
  }
  auto outcome = booking_service_->Reconcile();
  if (!outcome.ok()) {
    return WriteError(res, *outcome.error);
  }
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(*outcome.value)));
}

bool HttpSession::HasOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

void HttpSession::WriteJson(Response& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}

void HttpSession::WriteError(Response& res, const BookingError& error) {
  WriteJson(res, static_cast<boost::beast::http::status>(HttpStatusFor(error.kind)),
            MakeErrorEnvelope(error.code, error.message, ToJson(error)));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count());
    ctx.detail = {{"method", std::string(req_.method_string())},
                  {"target", std::string(req_.target())},
                  {"status", res->result_int()}};
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace scheduler
