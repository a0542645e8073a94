#include "util_log.hpp"
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

static std::mutex g_log_mu;
static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
static std::string g_log_file;

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_log_file = path;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw std::invalid_argument("Неизвестный уровень журнала: " + name);
}

void kb_log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < g_log_level.load()) return;

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << log_level_name(level) << "] " << message << std::endl;
    if (g_log_file.empty()) return;

    // файл только дописываем
    std::ofstream f(g_log_file, std::ios::app);
    if (f) f << "[" << log_level_name(level) << "] " << message << std::endl;
}
