/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 종료 신호를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "sent/app.hpp"

int main() {
  using namespace sent;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int /*signal*/) {
    if (ec) {
      return;
    }
    std::cout << "종료 신호 수신, 서버를 멈춥니다\n";
    app.GetContext().stop();
  });

  app.Run();
  app.Stop();
  return 0;
}
