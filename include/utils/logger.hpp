/*
 * 설명: 로그 레벨과 출력 경로를 제어하는 로거를 제공한다. 여러 세션 스레드에서 동시에 호출된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    bool SetOutput(const std::string &path);
    void Log(config::LogLevel level, const std::string &message);
    bool IsEnabled(config::LogLevel level) const;

   private:
    mutable std::mutex mutex_;
    config::LogLevel level_;
    std::string path_;
    std::ofstream file_;

    void WriteLine(const std::string &line);
};
