#include "memory_backend.hpp"

#include <algorithm>
#include <stdexcept>

std::vector<KbRecord>& MemoryBackend::rows(const std::string& table) {
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        throw std::runtime_error("Таблица не существует: " + table);
    }
    return it->second;
}

bool MemoryBackend::has_table(const std::string& table) const {
    std::lock_guard<std::mutex> lk(mu_);
    return tables_.count(table) != 0;
}

void MemoryBackend::create_table(const std::string& table) {
    std::lock_guard<std::mutex> lk(mu_);
    tables_.emplace(table, std::vector<KbRecord>{});
}

void MemoryBackend::drop_table(const std::string& table) {
    std::lock_guard<std::mutex> lk(mu_);
    tables_.erase(table);
}

void MemoryBackend::insert(const std::string& table, const KbRecord& record) {
    std::lock_guard<std::mutex> lk(mu_);
    rows(table).push_back(record);
}

std::vector<KbRecord> MemoryBackend::select(const std::string& table,
                                            const std::string& location_a,
                                            const std::optional<std::string>& location_b) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<KbRecord> out;
    for (const auto& r : rows(table)) {
        if (r.location_a != location_a) continue;
        if (location_b && r.location_b != *location_b) continue;
        out.push_back(r);
    }
    return out;
}

std::vector<KbRecord> MemoryBackend::select_all(const std::string& table) {
    std::lock_guard<std::mutex> lk(mu_);
    return rows(table);
}

std::optional<KbRecord> MemoryBackend::select_by_uniq_id(const std::string& table,
                                                         const std::string& uniq_id) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : rows(table)) {
        if (r.uniq_id == uniq_id) return r;
    }
    return std::nullopt;
}

std::size_t MemoryBackend::update_by_uniq_id(const std::string& table,
                                             const std::string& old_uniq_id,
                                             const std::string& new_uniq_id,
                                             const std::string& blob) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& v = rows(table);
    auto matched = std::count_if(v.begin(), v.end(),
                                 [&](const KbRecord& r) { return r.uniq_id == old_uniq_id; });
    if (matched != 1) return static_cast<std::size_t>(matched);

    auto it = std::find_if(v.begin(), v.end(),
                           [&](const KbRecord& r) { return r.uniq_id == old_uniq_id; });
    it->uniq_id = new_uniq_id;
    it->blob = blob;
    return 1;
}

std::size_t MemoryBackend::update_at(const std::string& table,
                                     const std::string& location_a,
                                     const std::string& location_b,
                                     const std::string& old_uniq_id,
                                     const std::string& new_uniq_id,
                                     const std::string& blob) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& v = rows(table);
    auto it = std::find_if(v.begin(), v.end(), [&](const KbRecord& r) {
        return r.location_a == location_a && r.location_b == location_b && r.uniq_id == old_uniq_id;
    });
    if (it == v.end()) return 0;

    it->uniq_id = new_uniq_id;
    it->blob = blob;
    return 1;
}

std::size_t MemoryBackend::delete_address(const std::string& table,
                                          const std::string& location_a,
                                          const std::string& location_b) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& v = rows(table);
    auto before = v.size();
    v.erase(std::remove_if(v.begin(), v.end(), [&](const KbRecord& r) {
                return r.location_a == location_a && r.location_b == location_b;
            }),
            v.end());
    return before - v.size();
}

std::size_t MemoryBackend::delete_all(const std::string& table) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& v = rows(table);
    auto n = v.size();
    v.clear();
    return n;
}

std::unique_ptr<DiskSet> MemoryBackend::open_set(const std::string&) {
    return std::make_unique<MemoryDiskSet>();
}

bool MemoryDiskSet::add(const std::string& key, const std::string& blob) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!keys_.insert(key).second) return false;
    blobs_.push_back(blob);
    return true;
}

std::vector<std::string> MemoryDiskSet::items() const {
    std::lock_guard<std::mutex> lk(mu_);
    return blobs_;
}

std::size_t MemoryDiskSet::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return blobs_.size();
}

void MemoryDiskSet::cleanup() {
    std::lock_guard<std::mutex> lk(mu_);
    keys_.clear();
    blobs_.clear();
}
