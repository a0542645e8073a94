#include "db.hpp"
#include "util_log.hpp"

#include <stdexcept>

Db::Db(const std::string& conn_str) : conn_(conn_str) {
    if (!conn_.is_open()) {
        throw std::runtime_error("Не удалось открыть соединение с PostgreSQL");
    }
    kb_log(LogLevel::Info, std::string("PostgreSQL: подключено к базе ") + conn_.dbname());
}

pqxx::connection& Db::conn() {
    return conn_;
}
