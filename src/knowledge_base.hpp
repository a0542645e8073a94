#pragma once
#include "config.hpp"
#include "coverage_set.hpp"
#include "finding.hpp"
#include "finding_codec.hpp"
#include "kb_backend.hpp"
#include "kb_observer.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Всё, у чего есть имя (обычно плагин), можно использовать как location_a.
class NamedEntity {
public:
    virtual ~NamedEntity() = default;
    virtual std::string get_name() const = 0;
};

// location_a: строка или именованная сущность, приводится к имени.
class KbLocation {
public:
    KbLocation(const std::string& name) : name_(name) {}
    KbLocation(const char* name) : name_(name) {}
    KbLocation(const NamedEntity& entity) : name_(entity.get_name()) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// URL: совпадает URL.
// Var: совпадают URL, имя параметра и набор ключей контейнера данных.
enum class FilterKind { Url, Var };

FilterKind filter_kind_from_string(const std::string& name);

using GroupCtor = std::function<InfoSet(std::vector<GroupMember>)>;
InfoSet default_group_ctor(std::vector<GroupMember> infos);

// location_a -> location_b -> значения в порядке вставки
using KbDump = std::map<std::string, std::map<std::string, std::vector<KbValue>>>;

// База знаний одной сессии сканирования: через неё плагины обмениваются
// найденным. Конструктор ничего не выделяет, таблица и наборы покрытия
// создаются при первой операции (setup()).
class KnowledgeBase {
public:
    explicit KnowledgeBase(std::shared_ptr<KbBackend> backend, KbConfig config = KbConfig());

    KnowledgeBase(const KnowledgeBase&) = delete;
    KnowledgeBase& operator=(const KnowledgeBase&) = delete;

    void setup();
    bool is_initialized() const { return initialized_.load(std::memory_order_acquire); }
    std::string table_name();

    // Добавляет находку, только если по адресу нет совпадающей под filter.
    // true -> добавлена.
    bool append_uniq(const KbLocation& location_a, const std::string& location_b,
                     const Finding& info, FilterKind filter = FilterKind::Var);
    bool append_uniq(const KbLocation& location_a, const std::string& location_b,
                     const Finding& info, const std::string& filter_name);

    // Добавляет info в подходящий InfoSet по адресу или создаёт новый через
    // group_ctor. Возвращает (InfoSet в том виде, как он сохранён, создан ли новый).
    std::pair<InfoSet, bool> append_uniq_group(const KbLocation& location_a,
                                               const std::string& location_b,
                                               const Finding& info,
                                               const GroupCtor& group_ctor = default_group_ctor);

    void append(const KbLocation& location_a, const std::string& location_b,
                const KbValue& value, bool ignore_type = false);

    // Только находки; сырое значение по адресу -> KbTypeError.
    std::vector<Finding> get(const KbLocation& location_a,
                             const std::optional<std::string>& location_b = std::nullopt);
    // Без проверки типов.
    std::vector<KbValue> get_values(const KbLocation& location_a,
                                    const std::optional<std::string>& location_b = std::nullopt);

    void update(const Finding& old_value, const Finding& new_value);

    void raw_write(const KbLocation& location_a, const std::string& location_b, const KbValue& value);
    // Пустой JSON-массив, если по адресу ничего нет.
    KbValue raw_read(const KbLocation& location_a, const std::string& location_b);
    std::optional<Finding> get_one(const KbLocation& location_a, const std::string& location_b);

    void clear(const KbLocation& location_a, const std::string& location_b);

    std::optional<KbValue> get_by_uniq_id(const std::string& uniq_id);

    std::vector<Finding> get_all_entries_of_class(const std::set<FindingKind>& kinds);
    std::vector<Finding> get_all_findings();
    std::vector<Finding> get_all_vulns();
    std::vector<Finding> get_all_infos();
    // opener и pool, если заданы, подключаются к каждому Shell.
    std::vector<Shell> get_all_shells(std::shared_ptr<UrlOpener> opener = nullptr,
                                      std::shared_ptr<WorkerPool> pool = nullptr);
    KbDump dump();

    bool add_url(const Url& url);
    bool add_fuzzable_request(const FuzzableRequest& request);
    std::vector<Url> get_all_known_urls();
    std::vector<FuzzableRequest> get_all_known_fuzzable_requests();

    int add_observer(KbObserver& observer);
    bool remove_observer(int handle);
    std::size_t observer_count() const { return observers_.size(); }

    // Очищает записи и наборы покрытия, снимает слушателей. Таблица остаётся.
    void cleanup();
    // Удаляет таблицу и наборы покрытия; следующая операция создаст новые.
    void remove();

private:
    void ensure_setup();
    std::unique_lock<std::recursive_mutex> primitive_lock();

    bool matches_url(const std::vector<Finding>& saved, const Finding& info) const;
    bool matches_var(const std::vector<Finding>& saved, const Finding& info) const;
    // update(), ограниченный одним адресом: одинаковые группы могут лежать
    // под разными адресами с одним и тем же uniq_id
    void update_group_at(const KbLocation& location_a, const std::string& location_b,
                         const InfoSet& old_set, const InfoSet& new_set);

    std::shared_ptr<KbBackend> backend_;
    KbConfig config_;

    std::recursive_mutex kb_lock_;
    std::atomic<bool> initialized_{false};

    std::string table_name_;
    std::unique_ptr<CoverageSet<Url>> urls_;
    std::unique_ptr<CoverageSet<FuzzableRequest>> fuzzable_requests_;

    ObserverRegistry observers_;
};
