#pragma once
#include "kb_backend.hpp"

#include <map>
#include <mutex>
#include <unordered_set>

// Хранилище в памяти процесса: для тестов и встраивания без PostgreSQL.
class MemoryBackend : public KbBackend {
public:
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

    bool has_table(const std::string& table) const;

private:
    std::vector<KbRecord>& rows(const std::string& table);

    mutable std::mutex mu_;
    std::map<std::string, std::vector<KbRecord>> tables_;
};

class MemoryDiskSet : public DiskSet {
public:
    bool add(const std::string& key, const std::string& blob) override;
    std::vector<std::string> items() const override;
    std::size_t size() const override;
    void cleanup() override;

private:
    mutable std::mutex mu_;
    std::unordered_set<std::string> keys_;
    std::vector<std::string> blobs_;
};
