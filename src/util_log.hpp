#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Потокобезопасный вывод в stderr и (если задан) в файл журнала.
void kb_log(LogLevel level, const std::string& message);

void set_log_level(LogLevel level);
void set_log_file(const std::string& path);

const char* log_level_name(LogLevel level);
LogLevel log_level_from_string(const std::string& name);
