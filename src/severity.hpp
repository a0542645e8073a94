#pragma once
#include <string>

enum class Severity { Information, Low, Medium, High };

std::string severity_to_string(Severity s);
Severity severity_from_string(const std::string& name);

inline bool is_vuln_severity(Severity s) {
    return s == Severity::Low || s == Severity::Medium || s == Severity::High;
}
