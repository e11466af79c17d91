/*
 * 설명: 태그 제거 기반의 입력 정제를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/sanitize_test.cpp
 */
#include "chatsync/sanitize.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "chatsync/message.hpp"

namespace chatsync {
namespace {
constexpr std::array<std::string_view, 4> kNonTextTags{"script", "style", "textarea", "option"};

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool IsUtf8Continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

// 코드포인트 단위로 자른다. 잘리는 위치가 "&...;" 엔티티 안이면 엔티티 앞에서 자른다.
std::string TruncateCodePoints(std::string text, std::size_t max_code_points) {
  std::size_t count = 0;
  std::size_t cut = 0;
  while (cut < text.size()) {
    if (!IsUtf8Continuation(text[cut])) {
      if (count == max_code_points) {
        break;
      }
      ++count;
    }
    ++cut;
  }
  if (cut == text.size()) {
    return text;
  }
  auto amp = text.rfind('&', cut - 1);
  if (amp != std::string::npos && text.find(';', amp) >= cut) {
    cut = amp;
  }
  text.resize(cut);
  return text;
}

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

// "<tag ...>" 에서 태그 이름만 추출한다. 닫는 태그이면 closing=true.
std::string TagName(std::string_view tag, bool& closing) {
  std::size_t pos = 1;
  closing = false;
  if (pos < tag.size() && tag[pos] == '/') {
    closing = true;
    ++pos;
  }
  std::size_t start = pos;
  while (pos < tag.size() && (std::isalnum(static_cast<unsigned char>(tag[pos])) || tag[pos] == '-')) {
    ++pos;
  }
  return ToLower(tag.substr(start, pos - start));
}

bool IsEntityAt(std::string_view text, std::size_t amp) {
  std::size_t pos = amp + 1;
  if (pos < text.size() && text[pos] == '#') {
    ++pos;
    std::size_t digits = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
    return pos > digits && pos < text.size() && text[pos] == ';';
  }
  std::size_t letters = pos;
  while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos > letters && pos < text.size() && text[pos] == ';';
}

void AppendEscaped(std::string_view text, std::string& out) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    switch (c) {
      case '&':
        out += IsEntityAt(text, i) ? "&" : "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
    }
  }
}
}  // namespace

std::string StripHtml(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  std::string skipping;
  std::size_t pos = 0;
  while (pos < input.size()) {
    auto lt = input.find('<', pos);
    std::size_t text_end = lt == std::string_view::npos ? input.size() : lt;
    if (skipping.empty()) {
      AppendEscaped(input.substr(pos, text_end - pos), out);
    }
    if (lt == std::string_view::npos) {
      break;
    }
    // 태그로 보이지 않는 '<' 는 텍스트로 취급한다.
    bool looks_like_tag = lt + 1 < input.size() &&
                          (std::isalpha(static_cast<unsigned char>(input[lt + 1])) || input[lt + 1] == '/' ||
                           input[lt + 1] == '!');
    auto gt = looks_like_tag ? input.find('>', lt) : std::string_view::npos;
    if (gt == std::string_view::npos) {
      if (skipping.empty()) {
        AppendEscaped(input.substr(lt, 1), out);
      }
      pos = lt + 1;
      continue;
    }
    bool closing = false;
    auto name = TagName(input.substr(lt, gt - lt + 1), closing);
    if (skipping.empty()) {
      if (!closing && std::find(kNonTextTags.begin(), kNonTextTags.end(), name) != kNonTextTags.end() &&
          input[gt - 1] != '/') {
        skipping = name;
      }
    } else if (closing && name == skipping) {
      skipping.clear();
    }
    pos = gt + 1;
  }
  return out;
}

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  std::size_t end = input.size();
  while (begin < end && IsSpace(input[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(input[end - 1])) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::string CleanDisplayName(std::string_view raw) {
  auto cleaned = Trim(TruncateCodePoints(Trim(StripHtml(Trim(raw))), kMaxDisplayNameLength));
  if (cleaned.empty()) {
    return std::string(kAnonymousName);
  }
  return cleaned;
}

std::string CleanMessageBody(std::string_view raw) { return StripHtml(raw); }

}  // namespace chatsync
