#pragma once
#include "util_log.hpp"

#include <memory>
#include <string>

class KbBackend;

// CompositeOnly: под общим мьютексом только append_uniq, append_uniq_group
// и setup; остальные операции атомарны лишь на уровне хранилища.
// AllOperations: мьютекс берут все операции.
enum class LockPolicy { CompositeOnly, AllOperations };

struct KbConfig {
    // пустая строка -> хранилище в памяти
    std::string pg_dsn;
    std::string table_prefix = "knowledge_base_";
    LockPolicy lock_policy = LockPolicy::CompositeOnly;
    LogLevel log_level = LogLevel::Info;
    std::string log_file;
};

// SCANKB_PG_DSN, SCANKB_TABLE_PREFIX, SCANKB_LOCK_POLICY (composite|all),
// SCANKB_LOG_LEVEL (debug|info|warn|error), SCANKB_LOG_FILE
KbConfig load_config_from_env();

LockPolicy lock_policy_from_string(const std::string& name);

// Применяет уровень и файл журнала.
void apply_log_config(const KbConfig& config);

std::shared_ptr<KbBackend> make_backend(const KbConfig& config);
