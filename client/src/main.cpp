/*
 * 설명: 터미널 채팅 클라이언트 진입점. 표준입력 명령을 ChatClient 호출로 바꾼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "chatsync/client/chat_client.hpp"

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

void Render(const chatsync::client::ChatReconciler& view) {
  std::cout << "----\n";
  for (const auto& entry : view.Messages()) {
    const auto& message = entry.message;
    std::cout << "[" << message.id << "] " << message.author << ": " << message.body;
    if (message.edited) {
      std::cout << " (수정됨)";
    }
    if (entry.local_only) {
      std::cout << " (전송 안 됨)";
    }
    if (!message.read_by.empty()) {
      std::cout << " 읽음:";
      for (const auto& reader : message.read_by) {
        std::cout << " " << reader;
      }
    }
    std::cout << "\n";
  }
  std::cout << "접속자:";
  for (const auto& name : view.Roster()) {
    std::cout << " " << name;
  }
  if (view.UnseenCount() > 0) {
    std::cout << "  새 메시지 " << view.UnseenCount() << "개 (/jump)";
  }
  std::cout << std::endl;
}

void PrintUsage() {
  std::cout << "명령: /name <이름>, /edit <id> <내용>, /delete <id>, /read <id>, /jump, /quit\n"
            << "그 외 입력은 메시지로 전송한다." << std::endl;
}
}  // namespace

int main(int argc, char** argv) {
  using namespace chatsync::client;
  try {
    ClientOptions options;
    options.host = argc > 1 ? argv[1] : GetEnv("CHAT_HOST", "127.0.0.1");
    options.port = argc > 2 ? argv[2] : GetEnv("CHAT_PORT", "5000");
    options.display_name = argc > 3 ? argv[3] : GetEnv("CHAT_NAME", "");
    options.reconnect_delay = std::chrono::milliseconds(std::stoul(GetEnv("CHAT_RECONNECT_MS", "3000")));

    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    auto client = ChatClient::Create(ioc, options);

    ClientListeners listeners;
    listeners.on_view_changed = [](const ChatReconciler& view) { Render(view); };
    listeners.on_connection_changed = [](bool online) {
      std::cout << (online ? "* 연결됨" : "* 오프라인: 메시지는 이 화면에만 표시된다") << std::endl;
    };
    listeners.on_typing_changed = [](const std::set<std::string>& subjects) {
      if (subjects.empty()) {
        return;
      }
      std::cout << "*";
      for (const auto& subject : subjects) {
        std::cout << " " << subject;
      }
      std::cout << " 입력 중..." << std::endl;
    };
    listeners.on_error = [](const std::string& code, const std::string& message) {
      std::cerr << "! " << code << (message.empty() ? "" : ": " + message) << std::endl;
    };
    client->SetListeners(std::move(listeners));
    client->Start();

    std::thread io_thread([&ioc]() { ioc.run(); });
    PrintUsage();

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      if (line[0] != '/') {
        client->Compose(line);
        client->SendText(line);
        continue;
      }
      std::istringstream iss(line);
      std::string command;
      iss >> command;
      std::string arg;
      iss >> arg;
      std::string rest;
      std::getline(iss >> std::ws, rest);
      if (command == "/quit") {
        break;
      } else if (command == "/name") {
        client->SetName(rest.empty() ? arg : arg + " " + rest);
      } else if (command == "/edit" && !arg.empty() && !rest.empty()) {
        client->Edit(arg, rest);
      } else if (command == "/delete" && !arg.empty()) {
        client->Delete(arg);
      } else if (command == "/read" && !arg.empty()) {
        client->MarkRead(arg);
      } else if (command == "/jump") {
        client->JumpToNewest();
      } else {
        PrintUsage();
      }
    }

    client->Stop();
    work.reset();
    io_thread.join();
  } catch (const std::exception& ex) {
    std::cerr << "클라이언트 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
