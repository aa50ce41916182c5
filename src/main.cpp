/*
 * 설명: vsicd 실행 진입점으로 설정 파일을 로드/검증하고 채팅 서버를 구동한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e
 */
#include <iostream>
#include <string>

#include "server.hpp"
#include "utils/config.hpp"

int main(int argc, char *argv[]) {
    if (argc > 2) {
        std::cerr << "사용법: ./vsicd [config_path]\n";
        return 1;
    }

    std::string config_path = argc == 2 ? argv[1] : "config/vsicd.ini";

    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 1;
    }
    if (!config::Validate(settings, error)) {
        std::cerr << "설정 검증 실패: " << error << "\n";
        return 1;
    }

    try {
        ChatServer server(settings);
        server.Run();
    } catch (const std::exception &ex) {
        std::cerr << "서버 오류: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
