/*
 * 설명: 사용자 입력(표시 이름, 메시지 본문)의 HTML 제거와 기본값 보정을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/sanitize_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chatsync {

// 표시 이름 최대 길이(코드포인트). 저장소 컬럼 VARCHAR(255)보다 작아야 한다.
constexpr std::size_t kMaxDisplayNameLength = 64;

// 태그를 모두 제거하고 남은 텍스트의 &, <, >, " 를 이스케이프한다.
// script/style/textarea/option 내부 텍스트는 버린다.
std::string StripHtml(std::string_view input);

std::string Trim(std::string_view input);

// trim -> HTML 제거 -> kMaxDisplayNameLength로 자름 -> 비면 "Anonymous"
std::string CleanDisplayName(std::string_view raw);

std::string CleanMessageBody(std::string_view raw);

}  // namespace chatsync
