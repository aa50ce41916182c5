/*
 * 설명: INI 설정 파일을 로드해 서버 설정 구조체를 생성하고 기동 전 검증을 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <climits>
#include <cstddef>
#include <string>
#include <vector>

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

const std::size_t kDefaultMaxConnsPerIp = 4;
const std::size_t kDefaultMaxMsgsPerSec = 1;
const std::size_t kDefaultMaxMsgSize = 4096;
const std::size_t kDefaultKeepaliveSec = 120;
const std::size_t kDefaultOutboundLines = 16;

// 밀리초로 바꿔 int 타임아웃에 담을 수 있는 최대 초.
const std::size_t kMaxKeepaliveSec = INT_MAX / 1000;

struct ListenerSettings {
    bool enabled;
    int port;
    std::string cert;
    std::string key;

    ListenerSettings() : enabled(false), port(0) {}
};

struct Settings {
    std::string server_name;
    std::string motd;
    bool allow_privileged_port;

    ListenerSettings tcp;
    ListenerSettings tls;

    std::size_t max_conns_per_ip;
    std::size_t max_msgs_per_sec;
    std::size_t max_msg_size;
    std::size_t max_keepalive_timeout;
    std::size_t outbound_lines;

    LogLevel log_level;
    std::string log_file;

    Settings();
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
bool Validate(const Settings &settings, std::string &error);

std::string LogLevelToString(LogLevel level);
std::string ExpandHome(const std::string &path);

// MOTD 텍스트를 줄 단위로 나누고 빈 줄을 제거한다.
std::vector<std::string> NormalizeMotd(const std::string &motd);

}  // namespace config
