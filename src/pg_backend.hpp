#pragma once
#include "kb_backend.hpp"

class Db;

// Хранилище базы знаний в PostgreSQL.
// Схема: (id BIGSERIAL, location_a TEXT, location_b TEXT, uniq_id TEXT, blob BYTEA),
// id нужен только для выдачи строк в порядке вставки.
class PgBackend : public KbBackend {
public:
    explicit PgBackend(std::shared_ptr<Db> db);

    void create_table(const std::string& table) override;
    void drop_table(const std::string& table) override;

    void insert(const std::string& table, const KbRecord& record) override;
    std::vector<KbRecord> select(const std::string& table,
                                 const std::string& location_a,
                                 const std::optional<std::string>& location_b) override;
    std::vector<KbRecord> select_all(const std::string& table) override;
    std::optional<KbRecord> select_by_uniq_id(const std::string& table,
                                              const std::string& uniq_id) override;
    std::size_t update_by_uniq_id(const std::string& table,
                                  const std::string& old_uniq_id,
                                  const std::string& new_uniq_id,
                                  const std::string& blob) override;
    std::size_t update_at(const std::string& table,
                          const std::string& location_a,
                          const std::string& location_b,
                          const std::string& old_uniq_id,
                          const std::string& new_uniq_id,
                          const std::string& blob) override;
    std::size_t delete_address(const std::string& table,
                               const std::string& location_a,
                               const std::string& location_b) override;
    std::size_t delete_all(const std::string& table) override;

    std::unique_ptr<DiskSet> open_set(const std::string& prefix) override;

private:
    std::shared_ptr<Db> db_;
};

// Таблица <prefix>_<случайные буквы> с первичным ключом по хешу элемента.
class PgDiskSet : public DiskSet {
public:
    PgDiskSet(std::shared_ptr<Db> db, const std::string& prefix);

    bool add(const std::string& key, const std::string& blob) override;
    std::vector<std::string> items() const override;
    std::size_t size() const override;
    void cleanup() override;

private:
    std::shared_ptr<Db> db_;
    std::string table_;
};
