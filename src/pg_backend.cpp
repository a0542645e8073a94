#include "pg_backend.hpp"
#include "crypto.hpp"
#include "db.hpp"

#include <cstddef>
#include <cstring>
#include <pqxx/pqxx>

// blob передаётся как BYTEA в двоичном виде, без перекодировки
using bytea = std::basic_string<std::byte>;

static bytea to_bytea(const std::string& s) {
    bytea out(s.size(), std::byte{0});
    if (!s.empty()) std::memcpy(out.data(), s.data(), s.size());
    return out;
}

static std::string from_bytea(const pqxx::field& f) {
    const bytea b = f.as<bytea>();
    return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

static KbRecord to_record(const pqxx::row& row) {
    KbRecord r;
    r.location_a = row[0].c_str();
    r.location_b = row[1].c_str();
    r.uniq_id = row[2].c_str();
    r.blob = from_bytea(row[3]);
    return r;
}

static std::vector<KbRecord> to_records(const pqxx::result& res) {
    std::vector<KbRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(to_record(row));
    return out;
}

PgBackend::PgBackend(std::shared_ptr<Db> db) : db_(std::move(db)) {}

void PgBackend::create_table(const std::string& table) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    const std::string t = tx.quote_name(table);
    tx.exec(
        "CREATE TABLE IF NOT EXISTS " + t + " ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  location_a TEXT,"
        "  location_b TEXT,"
        "  uniq_id TEXT,"
        "  blob BYTEA"
        ")"
    );
    tx.exec("CREATE INDEX IF NOT EXISTS " + tx.quote_name(table + "_loc") +
            " ON " + t + " (location_a, location_b)");
    tx.exec("CREATE INDEX IF NOT EXISTS " + tx.quote_name(table + "_uniq") +
            " ON " + t + " (uniq_id)");
    tx.commit();
}

void PgBackend::drop_table(const std::string& table) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    tx.exec("DROP TABLE IF EXISTS " + tx.quote_name(table));
    tx.commit();
}

void PgBackend::insert(const std::string& table, const KbRecord& record) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    tx.exec_params(
        "INSERT INTO " + tx.quote_name(table) +
        " (location_a, location_b, uniq_id, blob) VALUES ($1, $2, $3, $4)",
        record.location_a, record.location_b, record.uniq_id, to_bytea(record.blob)
    );
    tx.commit();
}

std::vector<KbRecord> PgBackend::select(const std::string& table,
                                        const std::string& location_a,
                                        const std::optional<std::string>& location_b) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    const std::string head =
        "SELECT location_a, location_b, uniq_id, blob FROM " + tx.quote_name(table);

    pqxx::result r;
    if (location_b) {
        r = tx.exec_params(head + " WHERE location_a = $1 AND location_b = $2 ORDER BY id",
                           location_a, *location_b);
    } else {
        r = tx.exec_params(head + " WHERE location_a = $1 ORDER BY id", location_a);
    }
    tx.commit();
    return to_records(r);
}

std::vector<KbRecord> PgBackend::select_all(const std::string& table) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec(
        "SELECT location_a, location_b, uniq_id, blob FROM " +
        tx.quote_name(table) + " ORDER BY id"
    );
    tx.commit();
    return to_records(r);
}

std::optional<KbRecord> PgBackend::select_by_uniq_id(const std::string& table,
                                                     const std::string& uniq_id) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec_params(
        "SELECT location_a, location_b, uniq_id, blob FROM " +
        tx.quote_name(table) + " WHERE uniq_id = $1 ORDER BY id LIMIT 1",
        uniq_id
    );
    tx.commit();

    if (r.empty()) return std::nullopt;
    return to_record(r[0]);
}

std::size_t PgBackend::update_by_uniq_id(const std::string& table,
                                         const std::string& old_uniq_id,
                                         const std::string& new_uniq_id,
                                         const std::string& blob) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    const std::string t = tx.quote_name(table);
    // одно выражение: подсчёт и UPDATE видят один и тот же снимок
    auto r = tx.exec_params(
        "WITH matched AS (SELECT COUNT(*) AS n FROM " + t + " WHERE uniq_id = $3), "
        "changed AS ("
        "  UPDATE " + t + " SET blob = $1, uniq_id = $2"
        "  WHERE uniq_id = $3 AND (SELECT n FROM matched) = 1"
        "  RETURNING 1"
        ") "
        "SELECT n FROM matched",
        to_bytea(blob), new_uniq_id, old_uniq_id
    );
    tx.commit();
    return static_cast<std::size_t>(r[0][0].as<long long>());
}

std::size_t PgBackend::update_at(const std::string& table,
                                 const std::string& location_a,
                                 const std::string& location_b,
                                 const std::string& old_uniq_id,
                                 const std::string& new_uniq_id,
                                 const std::string& blob) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    const std::string t = tx.quote_name(table);
    // первая по id строка адреса с этим uniq_id
    auto r = tx.exec_params(
        "UPDATE " + t + " SET blob = $1, uniq_id = $2 "
        "WHERE id = (SELECT id FROM " + t +
        "            WHERE location_a = $3 AND location_b = $4 AND uniq_id = $5"
        "            ORDER BY id LIMIT 1)",
        to_bytea(blob), new_uniq_id, location_a, location_b, old_uniq_id
    );
    tx.commit();
    return static_cast<std::size_t>(r.affected_rows());
}

std::size_t PgBackend::delete_address(const std::string& table,
                                      const std::string& location_a,
                                      const std::string& location_b) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec_params(
        "DELETE FROM " + tx.quote_name(table) + " WHERE location_a = $1 AND location_b = $2",
        location_a, location_b
    );
    tx.commit();
    return static_cast<std::size_t>(r.affected_rows());
}

std::size_t PgBackend::delete_all(const std::string& table) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec("DELETE FROM " + tx.quote_name(table));
    tx.commit();
    return static_cast<std::size_t>(r.affected_rows());
}

std::unique_ptr<DiskSet> PgBackend::open_set(const std::string& prefix) {
    return std::make_unique<PgDiskSet>(db_, prefix);
}

// ---------------- PgDiskSet ----------------

PgDiskSet::PgDiskSet(std::shared_ptr<Db> db, const std::string& prefix)
    : db_(std::move(db)), table_(prefix + "_" + random_alpha(20)) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    tx.exec(
        "CREATE TABLE IF NOT EXISTS " + tx.quote_name(table_) + " ("
        "  seq BIGSERIAL,"
        "  key_hash TEXT PRIMARY KEY,"
        "  blob BYTEA NOT NULL"
        ")"
    );
    tx.commit();
}

bool PgDiskSet::add(const std::string& key, const std::string& blob) {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    // уже есть -> DO NOTHING, RETURNING пустой
    auto r = tx.exec_params(
        "INSERT INTO " + tx.quote_name(table_) + " (key_hash, blob) VALUES ($1, $2) "
        "ON CONFLICT (key_hash) DO NOTHING "
        "RETURNING key_hash",
        sha256_hex(key), to_bytea(blob)
    );
    tx.commit();
    return !r.empty();
}

std::vector<std::string> PgDiskSet::items() const {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec("SELECT blob FROM " + tx.quote_name(table_) + " ORDER BY seq");
    tx.commit();

    std::vector<std::string> out;
    out.reserve(r.size());
    for (const auto& row : r) out.push_back(from_bytea(row[0]));
    return out;
}

std::size_t PgDiskSet::size() const {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    auto r = tx.exec("SELECT COUNT(*) AS c FROM " + tx.quote_name(table_));
    tx.commit();
    return static_cast<std::size_t>(r[0]["c"].as<long long>());
}

void PgDiskSet::cleanup() {
    std::lock_guard<std::mutex> lk(db_->mu());
    pqxx::work tx(db_->conn());
    tx.exec("DROP TABLE IF EXISTS " + tx.quote_name(table_));
    tx.commit();
}
