/*
 * 설명: 신규 연결 스냅샷 전송, 수신 이벤트 검증/저장소 변경, 결과 브로드캐스트를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "chatsync/session_coordinator.hpp"

#include <chrono>

#include "chatsync/events.hpp"
#include "chatsync/message.hpp"
#include "chatsync/sanitize.hpp"

namespace chatsync {
namespace {
// DATETIME 범위를 벗어나는 클라이언트 시각은 무시한다. 비교는 밀리초 정수로 한다.
constexpr std::int64_t kEarliestAcceptedMillis = 0;
constexpr std::int64_t kLatestAcceptedMillis = 253402300799999LL;  // 9999-12-31T23:59:59.999Z

std::string StringField(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return {};
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// id는 문자열 또는 정수 모두 허용한다.
std::optional<std::string> MessageIdField(const nlohmann::json& payload) {
  if (payload.is_string() || payload.is_number_integer()) {
    return payload.is_string() ? payload.get<std::string>() : payload.dump();
  }
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto it = payload.find("id");
  if (it == payload.end()) {
    return std::nullopt;
  }
  if (it->is_string() && !it->get<std::string>().empty()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return it->dump();
  }
  return std::nullopt;
}
}  // namespace

SessionCoordinator::SessionCoordinator(std::shared_ptr<MessageStore> store,
                                       std::shared_ptr<ConnectionRegistry> registry,
                                       std::shared_ptr<BroadcastDispatcher> dispatcher,
                                       std::shared_ptr<Observability> observability, CoordinatorOptions options,
                                       ClockFn clock)
    : store_(std::move(store)), registry_(std::move(registry)), dispatcher_(std::move(dispatcher)),
      observability_(std::move(observability)), options_(options), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

void SessionCoordinator::OnConnect(ConnectionId id, const std::shared_ptr<EventSink>& sink) {
  dispatcher_->Register(id, sink);
  auto roster = registry_->OnConnect(id);
  observability_->Event(LogLevel::kInfo, "chat.connect", id);

  dispatcher_->ToOne(id, events::kRoomUsers, roster);
  {
    // 스냅샷과 전송 사이에 다른 연결의 append+broadcast가 끼어들면
    // 신규 연결은 message를 먼저 받고 그 메시지가 빠진 history로 덮어쓴다.
    std::lock_guard<std::mutex> lock(append_mutex_);
    auto history = store_->ListActive(options_.history_limit);
    if (history.status == MutationStatus::kApplied) {
      dispatcher_->ToOne(id, events::kMessageHistory, MessagesToJson(history.messages));
    } else {
      SendMessageError(id, ToErrorCode(history.status), "메시지 기록을 불러오지 못했습니다", std::nullopt);
    }
  }
  // 신규 연결의 기본 이름이 명단에 추가되었으므로 전체에 다시 알린다.
  BroadcastRoster();
}

void SessionCoordinator::OnEvent(ConnectionId id, const std::string& event, const nlohmann::json& payload) {
  if (event == events::kSetUsername) {
    HandleSetUsername(id, payload);
  } else if (event == events::kSendMessage) {
    HandleSendMessage(id, payload);
  } else if (event == events::kDeleteMessage) {
    HandleDeleteMessage(id, payload);
  } else if (event == events::kEditMessage) {
    HandleEditMessage(id, payload);
  } else if (event == events::kMessageRead) {
    HandleMessageRead(id, payload);
  } else if (event == events::kTyping) {
    HandleTyping(id, payload);
  } else {
    dispatcher_->ErrorToOne(id, "bad_request", "알 수 없는 이벤트: " + event);
  }
}

void SessionCoordinator::OnDisconnect(ConnectionId id, const EventSink* sink) {
  registry_->OnDisconnect(id);
  dispatcher_->Unregister(id, sink);
  observability_->Event(LogLevel::kInfo, "chat.disconnect", id);
  BroadcastRoster();
}

ListResult SessionCoordinator::History() { return store_->ListActive(options_.history_limit); }

void SessionCoordinator::HandleSetUsername(ConnectionId id, const nlohmann::json& payload) {
  std::string raw = payload.is_string() ? payload.get<std::string>() : StringField(payload, "name");
  auto result = registry_->SetName(id, raw);
  observability_->Event(LogLevel::kDebug, "chat.set_username", id, result.name);
  BroadcastRoster();
}

void SessionCoordinator::HandleSendMessage(ConnectionId id, const nlohmann::json& payload) {
  if (!payload.is_object()) {
    dispatcher_->ErrorToOne(id, "bad_request", "send-message payload가 올바르지 않습니다");
    return;
  }
  auto author = registry_->SetName(id, StringField(payload, "user"));
  auto body = CleanMessageBody(StringField(payload, "text"));
  if (Trim(body).empty()) {
    SendMessageError(id, "bad_request", "메시지 본문이 비어 있습니다", std::nullopt);
    if (author.changed) {
      BroadcastRoster();
    }
    return;
  }

  TimePoint created_at = Now();
  if (payload.contains("time")) {
    auto requested = ParseTimestampField(payload["time"]);
    if (requested) {
      auto millis = ToEpochMillis(*requested);
      if (millis >= kEarliestAcceptedMillis && millis <= kLatestAcceptedMillis) {
        created_at = *requested;
      }
    }
  }

  std::unique_lock<std::mutex> lock(append_mutex_);
  auto appended = store_->Append(author.name, body, created_at);
  if (appended.status != MutationStatus::kApplied) {
    lock.unlock();
    // 저장 실패는 요청자에게만 알리고 브로드캐스트하지 않는다.
    SendMessageError(id, ToErrorCode(appended.status), ToErrorMessage(appended.status), std::nullopt);
    if (author.changed) {
      BroadcastRoster();
    }
    return;
  }
  dispatcher_->ToAll(events::kMessage, MessageToJson(appended.message));
  lock.unlock();
  observability_->IncrementMessagesAppended();
  observability_->Event(LogLevel::kInfo, "chat.message", id, appended.message.id);
  BroadcastRoster();
}

void SessionCoordinator::HandleDeleteMessage(ConnectionId id, const nlohmann::json& payload) {
  auto message_id = MessageIdField(payload);
  if (!message_id) {
    dispatcher_->ErrorToOne(id, "bad_request", "id가 필요합니다");
    return;
  }
  auto status = store_->SoftDelete(*message_id, RequesterName(id));
  if (status != MutationStatus::kApplied) {
    ReportRejection(id, "chat.delete", status, *message_id);
    return;
  }
  observability_->Event(LogLevel::kInfo, "chat.delete", id, *message_id);
  dispatcher_->ToAll(events::kDeleteMessage, {{"id", *message_id}});
}

void SessionCoordinator::HandleEditMessage(ConnectionId id, const nlohmann::json& payload) {
  auto message_id = MessageIdField(payload);
  if (!message_id || !payload.is_object()) {
    dispatcher_->ErrorToOne(id, "bad_request", "id가 필요합니다");
    return;
  }
  auto new_body = CleanMessageBody(StringField(payload, "newText"));
  if (Trim(new_body).empty()) {
    SendMessageError(id, "bad_request", "메시지 본문이 비어 있습니다", message_id);
    return;
  }
  auto result = store_->Edit(*message_id, RequesterName(id), new_body, Now());
  if (result.status != MutationStatus::kApplied) {
    ReportRejection(id, "chat.edit", result.status, *message_id);
    return;
  }
  observability_->Event(LogLevel::kInfo, "chat.edit", id, *message_id);
  dispatcher_->ToAll(events::kEditMessage,
                     {{"id", *message_id}, {"newText", result.body}, {"editTime", ToIsoString(result.edited_at)}});
}

void SessionCoordinator::HandleMessageRead(ConnectionId id, const nlohmann::json& payload) {
  auto message_id = MessageIdField(payload);
  if (!message_id) {
    dispatcher_->ErrorToOne(id, "bad_request", "id가 필요합니다");
    return;
  }
  auto reader = RequesterName(id);
  auto status = store_->MarkRead(*message_id, reader);
  if (status == MutationStatus::kAlready) {
    return;
  }
  if (status != MutationStatus::kApplied) {
    ReportRejection(id, "chat.read", status, *message_id);
    return;
  }
  dispatcher_->ToAll(events::kMessageRead, {{"id", *message_id}, {"readerName", reader}});
}

void SessionCoordinator::HandleTyping(ConnectionId id, const nlohmann::json& payload) {
  auto subject = registry_->SetName(id, StringField(payload, "user"));
  // 서버는 타이머를 두지 않는다. 만료는 수신 측이 처리한다.
  dispatcher_->ToAllExcept(id, events::kTyping, {{"user", subject.name}, {"at", ToEpochMillis(Now())}});
  if (subject.changed) {
    BroadcastRoster();
  }
}

void SessionCoordinator::BroadcastRoster() { dispatcher_->ToAll(events::kRoomUsers, registry_->SnapshotNames()); }

void SessionCoordinator::ReportRejection(ConnectionId id, const char* operation, MutationStatus status,
                                         const std::string& message_id) {
  observability_->Event(status == MutationStatus::kUnavailable ? LogLevel::kError : LogLevel::kInfo, operation, id,
                        std::string(ToErrorCode(status)) + " id=" + message_id);
  if (status == MutationStatus::kUnavailable || options_.notify_denials) {
    SendMessageError(id, ToErrorCode(status), ToErrorMessage(status), message_id);
  }
}

void SessionCoordinator::SendMessageError(ConnectionId id, std::string_view code, std::string_view reason,
                                          const std::optional<std::string>& message_id) {
  nlohmann::json payload{{"code", code}, {"reason", reason}};
  if (message_id) {
    payload["id"] = *message_id;
  }
  dispatcher_->ToOne(id, events::kMessageError, payload);
}

std::string SessionCoordinator::RequesterName(ConnectionId id) const {
  return registry_->NameOf(id).value_or(std::string(kAnonymousName));
}

TimePoint SessionCoordinator::Now() const { return clock_(); }

}  // namespace chatsync
