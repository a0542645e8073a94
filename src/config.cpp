#include "config.hpp"
#include "db.hpp"
#include "memory_backend.hpp"
#include "pg_backend.hpp"

#include <cstdlib>
#include <stdexcept>

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

LockPolicy lock_policy_from_string(const std::string& name) {
    if (name == "composite") return LockPolicy::CompositeOnly;
    if (name == "all") return LockPolicy::AllOperations;
    throw std::invalid_argument("Неизвестная политика блокировок: " + name);
}

KbConfig load_config_from_env() {
    KbConfig c;
    c.pg_dsn = env_or("SCANKB_PG_DSN", "");
    c.table_prefix = env_or("SCANKB_TABLE_PREFIX", c.table_prefix);
    c.lock_policy = lock_policy_from_string(env_or("SCANKB_LOCK_POLICY", "composite"));
    c.log_level = log_level_from_string(env_or("SCANKB_LOG_LEVEL", "info"));
    c.log_file = env_or("SCANKB_LOG_FILE", "");
    return c;
}

void apply_log_config(const KbConfig& config) {
    set_log_level(config.log_level);
    set_log_file(config.log_file);
}

std::shared_ptr<KbBackend> make_backend(const KbConfig& config) {
    if (config.pg_dsn.empty()) {
        return std::make_shared<MemoryBackend>();
    }
    return std::make_shared<PgBackend>(std::make_shared<Db>(config.pg_dsn));
}
