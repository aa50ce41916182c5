/*
 * 설명: INI 파일을 파싱해 서버 설정을 생성하고 리스너/한도 값을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
bool StartsWith(const std::string &text, char c) { return !text.empty() && text[0] == c; }

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string ToLower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ParseLogLevel(const std::string &raw, config::LogLevel &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "debug") {
        out = config::LogLevel::kDebug;
        return true;
    }
    if (lowered == "info") {
        out = config::LogLevel::kInfo;
        return true;
    }
    if (lowered == "warn") {
        out = config::LogLevel::kWarn;
        return true;
    }
    if (lowered == "error") {
        out = config::LogLevel::kError;
        return true;
    }
    return false;
}

bool ParseNumber(const std::string &raw, std::size_t &out) {
    if (raw.empty() || raw[0] == '-') {
        return false;
    }
    char *end = NULL;
    unsigned long value = std::strtoul(raw.c_str(), &end, 10);
    if (end == NULL || *end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

bool ParsePort(const std::string &raw, int &out) {
    std::size_t number = 0;
    if (!ParseNumber(raw, number) || number > 65535) {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

bool ParseBool(const std::string &raw, bool &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        out = false;
        return true;
    }
    return false;
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}

// 0 은 "미지정"으로 보고 기본값을 유지한다.
bool ParseLimit(const std::string &value, std::size_t &out) {
    std::size_t number = 0;
    if (!ParseNumber(value, number)) {
        return false;
    }
    if (number > 0) {
        out = number;
    }
    return true;
}

bool IsBlank(const std::string &text) { return Trim(text).empty(); }
}  // namespace

namespace config {

Settings::Settings()
    : server_name("vsicd"),
      allow_privileged_port(false),
      max_conns_per_ip(kDefaultMaxConnsPerIp),
      max_msgs_per_sec(kDefaultMaxMsgsPerSec),
      max_msg_size(kDefaultMaxMsgSize),
      max_keepalive_timeout(kDefaultKeepaliveSec),
      outbound_lines(kDefaultOutboundLines),
      log_level(LogLevel::kInfo) {
    tcp.enabled = true;
    tcp.port = 7000;
    tls.enabled = false;
    tls.port = 7001;
}

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    out = Settings();

    if (path.empty()) {
        return true;
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return true;
    }

    std::string section;
    std::string line;
    std::size_t line_no = 0;
    bool motd_seen = false;

    while (std::getline(file, line)) {
        ++line_no;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || StartsWith(trimmed, '#') || StartsWith(trimmed, ';')) {
            continue;
        }

        if (StartsWith(trimmed, '[')) {
            if (trimmed.size() < 3 || trimmed[trimmed.size() - 1] != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = ToLower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }

        std::size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }

        std::string key = ToLower(Trim(trimmed.substr(0, eq_pos)));
        std::string value = Trim(trimmed.substr(eq_pos + 1));
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        if (section == "server" && key == "name") {
            if (value.empty()) {
                error = LineError("server.name 누락", line_no);
                return false;
            }
            out.server_name = value;
        } else if (section == "server" && key == "motd") {
            // motd 키는 반복 가능하며 등장 순서대로 한 줄씩 누적된다.
            if (motd_seen) {
                out.motd += "\n";
            }
            out.motd += value;
            motd_seen = true;
        } else if (section == "server" && key == "allow_privileged_port") {
            if (!ParseBool(value, out.allow_privileged_port)) {
                error = LineError("server.allow_privileged_port 오류", line_no);
                return false;
            }
        } else if ((section == "tcp" || section == "tls") && key == "enabled") {
            ListenerSettings &listener = section == "tcp" ? out.tcp : out.tls;
            if (!ParseBool(value, listener.enabled)) {
                error = LineError(section + ".enabled 오류", line_no);
                return false;
            }
        } else if ((section == "tcp" || section == "tls") && key == "port") {
            ListenerSettings &listener = section == "tcp" ? out.tcp : out.tls;
            if (!ParsePort(value, listener.port)) {
                error = LineError(section + ".port 오류", line_no);
                return false;
            }
        } else if (section == "tls" && key == "cert") {
            out.tls.cert = ExpandHome(value);
        } else if (section == "tls" && key == "key") {
            out.tls.key = ExpandHome(value);
        } else if (section == "limits" && key == "max_conns_per_ip") {
            if (!ParseLimit(value, out.max_conns_per_ip)) {
                error = LineError("limits.max_conns_per_ip 오류", line_no);
                return false;
            }
        } else if (section == "limits" && key == "max_msgs_per_sec") {
            if (!ParseLimit(value, out.max_msgs_per_sec)) {
                error = LineError("limits.max_msgs_per_sec 오류", line_no);
                return false;
            }
        } else if (section == "limits" && key == "max_msg_size") {
            if (!ParseLimit(value, out.max_msg_size)) {
                error = LineError("limits.max_msg_size 오류", line_no);
                return false;
            }
        } else if (section == "limits" && key == "max_keepalive_timeout") {
            if (!ParseLimit(value, out.max_keepalive_timeout) ||
                out.max_keepalive_timeout > kMaxKeepaliveSec) {
                error = LineError("limits.max_keepalive_timeout 오류", line_no);
                return false;
            }
        } else if (section == "limits" && key == "outbound_lines") {
            if (!ParseLimit(value, out.outbound_lines)) {
                error = LineError("limits.outbound_lines 오류", line_no);
                return false;
            }
        } else if (section == "logging" && key == "level") {
            LogLevel parsed;
            if (!ParseLogLevel(value, parsed)) {
                error = LineError("logging.level 오류", line_no);
                return false;
            }
            out.log_level = parsed;
        } else if (section == "logging" && key == "file") {
            out.log_file = value;
        } else {
            error = LineError("알 수 없는 섹션/키", line_no);
            return false;
        }
    }

    return true;
}

bool Validate(const Settings &settings, std::string &error) {
    if (!settings.tcp.enabled && !settings.tls.enabled) {
        error = "tcp/tls 리스너가 모두 비활성화됨";
        return false;
    }

    const ListenerSettings *listeners[] = {&settings.tcp, &settings.tls};
    const char *names[] = {"tcp", "tls"};
    for (std::size_t i = 0; i < 2; ++i) {
        const ListenerSettings &listener = *listeners[i];
        if (!listener.enabled) {
            continue;
        }
        if (listener.port <= 0 || listener.port > 65535) {
            error = std::string(names[i]) + ".port 범위 오류";
            return false;
        }
        if (listener.port <= 1000 && !settings.allow_privileged_port) {
            error = std::string(names[i]) +
                    ".port 가 특권 포트(<=1000)임. server.allow_privileged_port=true 필요";
            return false;
        }
    }

    if (settings.tcp.enabled && settings.tls.enabled && settings.tcp.port == settings.tls.port) {
        error = "tcp.port 와 tls.port 가 같음";
        return false;
    }

    if (settings.tls.enabled && (settings.tls.cert.empty() || settings.tls.key.empty())) {
        error = "tls 활성화 시 tls.cert 와 tls.key 필요";
        return false;
    }

    if (settings.max_keepalive_timeout > kMaxKeepaliveSec) {
        error = "limits.max_keepalive_timeout 범위 오류";
        return false;
    }

    return true;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

std::string ExpandHome(const std::string &path) {
    if (path.size() < 2 || path[0] != '~' || path[1] != '/') {
        return path;
    }
    const char *home = std::getenv("HOME");
    if (home == NULL) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::vector<std::string> NormalizeMotd(const std::string &motd) {
    std::vector<std::string> lines;
    std::istringstream iss(motd);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        lines.push_back(line);
    }

    while (!lines.empty() && IsBlank(lines.front())) {
        lines.erase(lines.begin());
    }
    while (!lines.empty() && IsBlank(lines.back())) {
        lines.pop_back();
    }

    std::vector<std::string> result;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!lines[i].empty()) {
            result.push_back(lines[i]);
        }
    }
    return result;
}

}  // namespace config
