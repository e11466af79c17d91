/*
 * 설명: 클라이언트/서버 간 WS 이벤트 이름을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

namespace chatsync::events {

// client -> server
inline constexpr char kSetUsername[] = "set-username";
inline constexpr char kSendMessage[] = "send-message";
inline constexpr char kTyping[] = "typing";

// 양방향 (client 요청 / server 브로드캐스트)
inline constexpr char kDeleteMessage[] = "delete-message";
inline constexpr char kEditMessage[] = "edit-message";
inline constexpr char kMessageRead[] = "message-read";

// server -> client
inline constexpr char kMessageHistory[] = "message-history";
inline constexpr char kMessage[] = "message";
inline constexpr char kRoomUsers[] = "room-users";
inline constexpr char kMessageError[] = "message-error";

}  // namespace chatsync::events
