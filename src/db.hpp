#pragma once
#include <pqxx/pqxx>
#include <mutex>
#include <string>

// Одно соединение с PostgreSQL на сессию сканирования.
// pqxx::connection не потокобезопасен: каждая транзакция берёт mu().
class Db {
public:
    explicit Db(const std::string& conn_str);
    pqxx::connection& conn();
    std::mutex& mu() { return mu_; }
private:
    pqxx::connection conn_;
    std::mutex mu_;
};
