#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct KbRecord {
    std::string location_a;
    std::string location_b;
    std::string uniq_id;
    std::string blob;  // байты, не обязательно текст
};

// Дедуплицирующее множество покрытия (известные URL, формы запросов).
class DiskSet {
public:
    virtual ~DiskSet() = default;

    // true, если ключ ранее не встречался
    virtual bool add(const std::string& key, const std::string& blob) = 0;
    // blob'ы в порядке добавления
    virtual std::vector<std::string> items() const = 0;
    virtual std::size_t size() const = 0;
    // удаляет хранилище множества целиком
    virtual void cleanup() = 0;
};

// Хранилище записей базы знаний. Каждый метод атомарен сам по себе,
// общих транзакций между вызовами нет.
class KbBackend {
public:
    virtual ~KbBackend() = default;

    // таблица + индексы (location_a, location_b) и (uniq_id)
    virtual void create_table(const std::string& table) = 0;
    virtual void drop_table(const std::string& table) = 0;

    virtual void insert(const std::string& table, const KbRecord& record) = 0;
    // location_b == nullopt: все записи под location_a
    virtual std::vector<KbRecord> select(const std::string& table,
                                         const std::string& location_a,
                                         const std::optional<std::string>& location_b) = 0;
    virtual std::vector<KbRecord> select_all(const std::string& table) = 0;
    virtual std::optional<KbRecord> select_by_uniq_id(const std::string& table,
                                                      const std::string& uniq_id) = 0;
    // Возвращает число строк со старым uniq_id; изменение применяется,
    // только если такая строка ровно одна.
    virtual std::size_t update_by_uniq_id(const std::string& table,
                                          const std::string& old_uniq_id,
                                          const std::string& new_uniq_id,
                                          const std::string& blob) = 0;
    // Меняет первую по порядку вставки запись адреса со старым uniq_id.
    // Возвращает число изменённых строк: 0 или 1.
    virtual std::size_t update_at(const std::string& table,
                                  const std::string& location_a,
                                  const std::string& location_b,
                                  const std::string& old_uniq_id,
                                  const std::string& new_uniq_id,
                                  const std::string& blob) = 0;
    virtual std::size_t delete_address(const std::string& table,
                                       const std::string& location_a,
                                       const std::string& location_b) = 0;
    virtual std::size_t delete_all(const std::string& table) = 0;

    virtual std::unique_ptr<DiskSet> open_set(const std::string& prefix) = 0;
};
