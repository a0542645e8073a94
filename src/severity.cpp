#include "severity.hpp"
#include "kb_errors.hpp"

std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::Information: return "Information";
        case Severity::Low:         return "Low";
        case Severity::Medium:      return "Medium";
        case Severity::High:        return "High";
    }
    return "Information";
}

Severity severity_from_string(const std::string& name) {
    if (name == "Information") return Severity::Information;
    if (name == "Low")         return Severity::Low;
    if (name == "Medium")      return Severity::Medium;
    if (name == "High")        return Severity::High;
    throw KbTypeError("Неизвестная критичность: " + name);
}
