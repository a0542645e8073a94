#include "knowledge_base.hpp"
#include "crypto.hpp"
#include "kb_errors.hpp"
#include "util_log.hpp"

FilterKind filter_kind_from_string(const std::string& name) {
    if (name == "URL") return FilterKind::Url;
    if (name == "VAR") return FilterKind::Var;
    throw KbTypeError("append_uniq знает только фильтры URL и VAR, получен: " + name);
}

InfoSet default_group_ctor(std::vector<GroupMember> infos) {
    return InfoSet(std::move(infos));
}

static bool is_info_like(const Finding& f) {
    auto kind = finding_kind(f);
    return kind == FindingKind::Info || kind == FindingKind::Vuln;
}

static GroupMember to_member(const Finding& f) {
    if (const auto* v = std::get_if<Vuln>(&f)) return *v;
    return std::get<Info>(f);
}

KnowledgeBase::KnowledgeBase(std::shared_ptr<KbBackend> backend, KbConfig config)
    : backend_(std::move(backend)), config_(std::move(config)) {}

void KnowledgeBase::setup() {
    std::lock_guard<std::recursive_mutex> lk(kb_lock_);

    // только один раз
    if (initialized_.load(std::memory_order_acquire)) return;

    urls_ = std::make_unique<CoverageSet<Url>>(backend_->open_set("kb_urls"));
    fuzzable_requests_ = std::make_unique<CoverageSet<FuzzableRequest>>(
        backend_->open_set("kb_fuzzable_requests"));

    table_name_ = config_.table_prefix + random_alpha(30);
    backend_->create_table(table_name_);

    initialized_.store(true, std::memory_order_release);
    kb_log(LogLevel::Info, "База знаний готова, таблица " + table_name_);
}

void KnowledgeBase::ensure_setup() {
    if (!initialized_.load(std::memory_order_acquire)) setup();
}

std::unique_lock<std::recursive_mutex> KnowledgeBase::primitive_lock() {
    if (config_.lock_policy == LockPolicy::AllOperations) {
        return std::unique_lock<std::recursive_mutex>(kb_lock_);
    }
    return std::unique_lock<std::recursive_mutex>(kb_lock_, std::defer_lock);
}

std::string KnowledgeBase::table_name() {
    ensure_setup();
    return table_name_;
}

// ---------------- дедупликация ----------------

bool KnowledgeBase::matches_url(const std::vector<Finding>& saved, const Finding& info) const {
    const auto url = finding_url(info);
    for (const auto& s : saved) {
        if (finding_url(s) == url) return true;
    }
    return false;
}

bool KnowledgeBase::matches_var(const std::vector<Finding>& saved, const Finding& info) const {
    const auto url = finding_url(info);
    const auto token = finding_token_name(info);
    const auto dc = finding_dc(info);

    for (const auto& s : saved) {
        if (finding_token_name(s) != token || finding_url(s) != url) continue;

        const auto saved_dc = finding_dc(s);
        if (!saved_dc && !dc) return true;
        if (saved_dc && dc && saved_dc->key_set() == dc->key_set()) return true;
    }
    return false;
}

bool KnowledgeBase::append_uniq(const KbLocation& location_a, const std::string& location_b,
                                const Finding& info, FilterKind filter) {
    if (!is_info_like(info)) {
        throw KbTypeError("append_uniq принимает только Info или Vuln");
    }
    ensure_setup();

    std::lock_guard<std::recursive_mutex> lk(kb_lock_);

    const auto saved = get(location_a, location_b);
    const bool duplicate = (filter == FilterKind::Url) ? matches_url(saved, info)
                                                       : matches_var(saved, info);
    if (duplicate) {
        kb_log(LogLevel::Debug, "append_uniq: дубликат в " + location_a.name() + "/" + location_b);
        return false;
    }

    append(location_a, location_b, KbValue(std::in_place_type<Finding>, info));
    return true;
}

bool KnowledgeBase::append_uniq(const KbLocation& location_a, const std::string& location_b,
                                const Finding& info, const std::string& filter_name) {
    return append_uniq(location_a, location_b, info, filter_kind_from_string(filter_name));
}

std::pair<InfoSet, bool> KnowledgeBase::append_uniq_group(const KbLocation& location_a,
                                                          const std::string& location_b,
                                                          const Finding& info,
                                                          const GroupCtor& group_ctor) {
    if (!is_info_like(info)) {
        throw KbTypeError("append_uniq_group принимает только Info или Vuln");
    }
    ensure_setup();

    std::lock_guard<std::recursive_mutex> lk(kb_lock_);

    const GroupMember member = to_member(info);
    for (const auto& saved : get(location_a, location_b)) {
        const auto* info_set = std::get_if<InfoSet>(&saved);
        if (!info_set || !info_set->match(as_info(member))) continue;

        // снимок до изменения нужен update() и слушателям
        const InfoSet old_set = *info_set;
        InfoSet new_set = *info_set;
        new_set.add(member);
        update_group_at(location_a, location_b, old_set, new_set);
        return {new_set, false};
    }

    InfoSet created = group_ctor({member});
    append(location_a, location_b, KbValue(std::in_place_type<Finding>, created));
    return {created, true};
}

void KnowledgeBase::update_group_at(const KbLocation& location_a, const std::string& location_b,
                                    const InfoSet& old_set, const InfoSet& new_set) {
    const Finding old_value(old_set);
    const Finding new_value(new_set);
    const std::string old_id = old_set.get_uniq_id();

    const std::size_t changed = backend_->update_at(
        table_name_, location_a.name(), location_b, old_id, new_set.get_uniq_id(),
        encode_value(KbValue(std::in_place_type<Finding>, new_value)));
    if (changed != 1) {
        const std::string msg = "Группа " + old_id + " пропала из " + location_a.name() + "/" + location_b;
        kb_log(LogLevel::Error, msg);
        throw KbDbError(msg);
    }
    observers_.notify_update(old_value, new_value);
}

// ---------------- хранилище ----------------

void KnowledgeBase::append(const KbLocation& location_a, const std::string& location_b,
                           const KbValue& value, bool ignore_type) {
    if (!ignore_type && !is_finding(value)) {
        throw KbTypeError("Не-находки сохраняются только через raw_write/raw_read");
    }
    ensure_setup();
    auto lk = primitive_lock();

    KbRecord r;
    r.location_a = location_a.name();
    r.location_b = location_b;
    r.uniq_id = value_uniq_id(value);
    r.blob = encode_value(value);
    backend_->insert(table_name_, r);

    observers_.notify_append(r.location_a, location_b, value, ignore_type);
}

std::vector<KbValue> KnowledgeBase::get_values(const KbLocation& location_a,
                                               const std::optional<std::string>& location_b) {
    ensure_setup();
    auto lk = primitive_lock();

    std::vector<KbValue> out;
    for (const auto& r : backend_->select(table_name_, location_a.name(), location_b)) {
        out.push_back(decode_value(r.blob));
    }
    return out;
}

std::vector<Finding> KnowledgeBase::get(const KbLocation& location_a,
                                        const std::optional<std::string>& location_b) {
    std::vector<Finding> out;
    for (auto& v : get_values(location_a, location_b)) {
        if (!is_finding(v)) {
            throw KbTypeError("Для чтения не-находок используйте raw_read");
        }
        out.push_back(std::move(std::get<Finding>(v)));
    }
    return out;
}

void KnowledgeBase::update(const Finding& old_value, const Finding& new_value) {
    ensure_setup();
    auto lk = primitive_lock();

    const std::string old_id = finding_uniq_id(old_value);
    const std::string new_id = finding_uniq_id(new_value);
    const std::size_t matched = backend_->update_by_uniq_id(
        table_name_, old_id, new_id, encode_value(KbValue(std::in_place_type<Finding>, new_value)));

    if (matched == 1) {
        observers_.notify_update(old_value, new_value);
        return;
    }

    std::string msg;
    if (matched == 0) {
        msg = std::string("Не удалось выполнить update() для ") + finding_kind_name(finding_kind(old_value)) +
              ": исходный uniq_id (" + old_id + ") отсутствует в базе или новый uniq_id (" +
              new_id + ") недопустим";
    } else {
        msg = std::string("Не удалось выполнить update() для ") + finding_kind_name(finding_kind(old_value)) +
              ": uniq_id (" + old_id + ") принадлежит " + std::to_string(matched) + " записям";
    }
    kb_log(LogLevel::Error, msg);
    throw KbDbError(msg);
}

void KnowledgeBase::raw_write(const KbLocation& location_a, const std::string& location_b,
                              const KbValue& value) {
    if (is_finding(value)) {
        throw KbTypeError("Находки сохраняются через append или append_uniq");
    }
    ensure_setup();
    auto lk = primitive_lock();

    clear(location_a, location_b);
    append(location_a, location_b, value, true);
}

KbValue KnowledgeBase::raw_read(const KbLocation& location_a, const std::string& location_b) {
    auto result = get_values(location_a, location_b);

    if (result.size() > 1) {
        const std::string msg = "Неверное использование raw_write/raw_read, найдено записей: " +
                                std::to_string(result.size());
        kb_log(LogLevel::Error, msg);
        throw KbCardinalityError(msg, result.size());
    }
    if (result.empty()) return raw_value(RawValue::array());
    return std::move(result.front());
}

std::optional<Finding> KnowledgeBase::get_one(const KbLocation& location_a, const std::string& location_b) {
    auto result = get(location_a, location_b);

    if (result.size() > 1) {
        const std::string msg = "Неверное использование get_one(), найдено записей: " +
                                std::to_string(result.size());
        kb_log(LogLevel::Error, msg);
        throw KbCardinalityError(msg, result.size());
    }
    if (result.empty()) return std::nullopt;
    return std::move(result.front());
}

void KnowledgeBase::clear(const KbLocation& location_a, const std::string& location_b) {
    ensure_setup();
    auto lk = primitive_lock();
    backend_->delete_address(table_name_, location_a.name(), location_b);
}

std::optional<KbValue> KnowledgeBase::get_by_uniq_id(const std::string& uniq_id) {
    ensure_setup();
    auto lk = primitive_lock();

    auto r = backend_->select_by_uniq_id(table_name_, uniq_id);
    if (!r) return std::nullopt;
    return decode_value(r->blob);
}

std::vector<Finding> KnowledgeBase::get_all_entries_of_class(const std::set<FindingKind>& kinds) {
    ensure_setup();
    auto lk = primitive_lock();

    std::vector<Finding> out;
    for (const auto& r : backend_->select_all(table_name_)) {
        KbValue v = decode_value(r.blob);
        if (!is_finding(v)) continue;

        auto& f = std::get<Finding>(v);
        if (kinds.count(finding_kind(f))) out.push_back(std::move(f));
    }
    return out;
}

std::vector<Finding> KnowledgeBase::get_all_findings() {
    return get_all_entries_of_class({FindingKind::Info, FindingKind::Vuln, FindingKind::InfoSet});
}

std::vector<Finding> KnowledgeBase::get_all_vulns() {
    std::vector<Finding> out;
    for (auto& f : get_all_entries_of_class({FindingKind::Info, FindingKind::Vuln, FindingKind::InfoSet})) {
        auto severity = finding_severity(f);
        if (severity && is_vuln_severity(*severity)) out.push_back(std::move(f));
    }
    return out;
}

std::vector<Finding> KnowledgeBase::get_all_infos() {
    std::vector<Finding> out;
    for (auto& f : get_all_entries_of_class({FindingKind::Info, FindingKind::Vuln, FindingKind::InfoSet})) {
        auto severity = finding_severity(f);
        if (severity && *severity == Severity::Information) out.push_back(std::move(f));
    }
    return out;
}

std::vector<Shell> KnowledgeBase::get_all_shells(std::shared_ptr<UrlOpener> opener,
                                                 std::shared_ptr<WorkerPool> pool) {
    std::vector<Shell> out;
    for (auto& f : get_all_entries_of_class({FindingKind::Shell})) {
        Shell shell = std::move(std::get<Shell>(f));
        if (opener) shell.set_url_opener(opener);
        if (pool) shell.set_worker_pool(pool);
        out.push_back(std::move(shell));
    }
    return out;
}

KbDump KnowledgeBase::dump() {
    ensure_setup();
    auto lk = primitive_lock();

    KbDump result;
    for (const auto& r : backend_->select_all(table_name_)) {
        result[r.location_a][r.location_b].push_back(decode_value(r.blob));
    }
    return result;
}

// ---------------- покрытие ----------------

bool KnowledgeBase::add_url(const Url& url) {
    ensure_setup();
    auto lk = primitive_lock();

    observers_.notify_add_url(url);
    return urls_->add(url);
}

bool KnowledgeBase::add_fuzzable_request(const FuzzableRequest& request) {
    ensure_setup();
    auto lk = primitive_lock();

    // два независимых шага, общей транзакции нет
    add_url(request.get_url());
    return fuzzable_requests_->add(request);
}

std::vector<Url> KnowledgeBase::get_all_known_urls() {
    ensure_setup();
    auto lk = primitive_lock();
    return urls_->items();
}

std::vector<FuzzableRequest> KnowledgeBase::get_all_known_fuzzable_requests() {
    ensure_setup();
    auto lk = primitive_lock();
    return fuzzable_requests_->items();
}

// ---------------- слушатели ----------------

int KnowledgeBase::add_observer(KbObserver& observer) {
    return observers_.add(observer);
}

bool KnowledgeBase::remove_observer(int handle) {
    return observers_.remove(handle);
}

// ---------------- жизненный цикл ----------------

void KnowledgeBase::cleanup() {
    ensure_setup();
    std::lock_guard<std::recursive_mutex> lk(kb_lock_);

    backend_->delete_all(table_name_);

    // старые наборы удаляем, создаём пустые
    urls_->cleanup();
    urls_ = std::make_unique<CoverageSet<Url>>(backend_->open_set("kb_urls"));
    fuzzable_requests_->cleanup();
    fuzzable_requests_ = std::make_unique<CoverageSet<FuzzableRequest>>(
        backend_->open_set("kb_fuzzable_requests"));

    observers_.clear();
    kb_log(LogLevel::Info, "База знаний очищена, таблица " + table_name_);
}

void KnowledgeBase::remove() {
    ensure_setup();
    std::lock_guard<std::recursive_mutex> lk(kb_lock_);

    backend_->drop_table(table_name_);
    urls_->cleanup();
    fuzzable_requests_->cleanup();
    urls_.reset();
    fuzzable_requests_.reset();
    observers_.clear();

    kb_log(LogLevel::Info, "Таблица базы знаний удалена: " + table_name_);
    table_name_.clear();
    initialized_.store(false, std::memory_order_release);
}
