#pragma once
#include <string>

// Случайная строка из латинских букв (имена таблиц сессии).
std::string random_alpha(std::size_t length = 30);
std::string sha256_hex(const std::string& data);
