#include <iostream>
#include <string>
#include <cctype>

#ifdef _WIN32
  #include <windows.h>
#endif

#include "config.hpp"
#include "kb_errors.hpp"
#include "knowledge_base.hpp"
#include "util_log.hpp"

// ---------------- helper functions ----------------
static void set_console_utf8() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
}

static void show_banner() {
    std::cout <<
        "========================================\n"
        "      БАЗА ЗНАНИЙ СЕССИИ СКАНИРОВАНИЯ\n"
        "========================================\n\n";
}

static std::string trim(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

static std::string ask(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    std::getline(std::cin, line);
    return trim(line);
}

static void show_main_menu(const std::string& table) {
    std::cout << "Таблица сессии: " << table << "\n\n";
    std::cout <<
        "1. Добавить URL\n"
        "2. Добавить находку\n"
        "3. Уязвимости\n"
        "4. Информационные находки\n"
        "5. Известные URL\n"
        "6. Дамп базы знаний\n"
        "7. Очистить сессию\n"
        "8. Выход\n"
        "> ";
}

static void print_finding(const Finding& f) {
    auto severity = finding_severity(f);
    auto url = finding_url(f);
    std::cout << "[" << finding_kind_name(finding_kind(f)) << "] "
              << (severity ? severity_to_string(*severity) : std::string("-")) << " | "
              << (url ? url->str() : std::string("-")) << " | "
              << finding_token_name(f) << " | " << finding_uniq_id(f) << "\n";
}

static void print_value(const KbValue& v) {
    if (is_finding(v)) {
        print_finding(std::get<Finding>(v));
    } else {
        std::cout << "[raw] " << std::get<RawValue>(v).dump(-1, ' ', false, RawValue::error_handler_t::replace) << "\n";
    }
}

static void add_finding(KnowledgeBase& kb) {
    const std::string plugin = ask("Плагин: ");
    const std::string name = ask("Название: ");
    const std::string url = ask("URL: ");
    const std::string token = ask("Параметр: ");
    const std::string sev = ask("Критичность (Information/Low/Medium/High): ");

    Severity severity = severity_from_string(sev);
    Info info(name, name, severity, plugin);
    info.set_url(Url(url));
    info.set_token_name(token);

    bool added = false;
    if (is_vuln_severity(severity)) {
        added = kb.append_uniq(plugin, "vulns", Vuln(info));
    } else {
        added = kb.append_uniq(plugin, "infos", info);
    }
    std::cout << (added ? "Находка добавлена.\n" : "Такая находка уже есть.\n");
}

int main() {
    set_console_utf8();

    try {
        KbConfig config = load_config_from_env();
        apply_log_config(config);

        KnowledgeBase kb(make_backend(config), config);

        show_banner();
        while (true) {
            show_main_menu(kb.table_name());

            std::string choice;
            if (!std::getline(std::cin, choice)) break;
            choice = trim(choice);

            try {
                if (choice == "1") {
                    bool added = kb.add_url(Url(ask("URL: ")));
                    std::cout << (added ? "URL добавлен.\n" : "URL уже известен.\n");
                } else if (choice == "2") {
                    add_finding(kb);
                } else if (choice == "3") {
                    auto vulns = kb.get_all_vulns();
                    std::cout << "Уязвимостей: " << vulns.size() << "\n";
                    for (const auto& f : vulns) print_finding(f);
                } else if (choice == "4") {
                    auto infos = kb.get_all_infos();
                    std::cout << "Информационных находок: " << infos.size() << "\n";
                    for (const auto& f : infos) print_finding(f);
                } else if (choice == "5") {
                    for (const auto& u : kb.get_all_known_urls()) std::cout << u.str() << "\n";
                } else if (choice == "6") {
                    for (const auto& [a, by_b] : kb.dump()) {
                        for (const auto& [b, values] : by_b) {
                            std::cout << a << " / " << b << ":\n";
                            for (const auto& v : values) {
                                std::cout << "  ";
                                print_value(v);
                            }
                        }
                    }
                } else if (choice == "7") {
                    kb.cleanup();
                    std::cout << "Сессия очищена.\n";
                } else if (choice == "8") {
                    break;
                } else {
                    std::cout << "Неизвестный пункт меню.\n";
                }
            } catch (const KbTypeError& e) {
                std::cout << "Ошибка ввода: " << e.what() << "\n";
            }
            std::cout << "\n";
        }

        kb.remove();
    } catch (const std::exception& e) {
        kb_log(LogLevel::Error, e.what());
        return 1;
    }
    return 0;
}
