#pragma once
#include "severity.hpp"
#include "url.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Информационная находка плагина.
class Info {
public:
    Info(std::string name, std::string description, Severity severity, std::string plugin_name);
    virtual ~Info() = default;
    Info(const Info&) = default;
    Info(Info&&) = default;
    Info& operator=(const Info&) = default;
    Info& operator=(Info&&) = default;

    const std::string& get_name() const { return name_; }
    const std::string& get_desc() const { return description_; }
    const std::string& get_plugin_name() const { return plugin_name_; }

    Severity get_severity() const { return severity_; }
    virtual void set_severity(Severity s) { severity_ = s; }

    const std::optional<Url>& get_url() const { return url_; }
    void set_url(const Url& url) { url_ = url; }

    const std::string& get_token_name() const { return token_name_; }
    void set_token_name(const std::string& token) { token_name_ = token; }

    const std::optional<DataContainer>& get_dc() const { return dc_; }
    void set_dc(const DataContainer& dc) { dc_ = dc; }

    const std::vector<int>& get_ids() const { return ids_; }
    void add_id(int response_id) { ids_.push_back(response_id); }

    // Произвольные атрибуты; по ним InfoSet может группировать находки.
    std::string get_attr(const std::string& name) const;
    void set_attr(const std::string& name, const std::string& value) { attrs_[name] = value; }
    const std::map<std::string, std::string>& attrs() const { return attrs_; }

    std::string get_uniq_id() const;

protected:
    std::string identity_material(const char* kind) const;

private:
    std::string name_;
    std::string description_;
    Severity severity_;
    std::string plugin_name_;
    std::optional<Url> url_;
    std::string token_name_;
    std::optional<DataContainer> dc_;
    std::vector<int> ids_;
    std::map<std::string, std::string> attrs_;
};

// Подтверждённая уязвимость: критичность только Low/Medium/High.
class Vuln : public Info {
public:
    Vuln(std::string name, std::string description, Severity severity, std::string plugin_name);
    explicit Vuln(const Info& info);

    // и через Info& тоже: Information для уязвимости недопустима
    void set_severity(Severity s) override;
    std::string get_uniq_id() const;
};

using GroupMember = std::variant<Info, Vuln>;

const Info& as_info(const GroupMember& member);

// Группа находок, считающихся дубликатами друг друга.
// Правило группировки: одинаковое имя, а если задан itag, то ещё и
// одинаковое значение атрибута itag.
class InfoSet {
public:
    explicit InfoSet(std::vector<GroupMember> infos, std::string itag = "");

    bool match(const Info& info) const;
    void add(const GroupMember& info);

    const std::vector<GroupMember>& infos() const { return infos_; }
    const Info& first_info() const { return as_info(infos_.front()); }
    const std::string& get_itag() const { return itag_; }
    std::size_t size() const { return infos_.size(); }

    const std::string& get_name() const { return first_info().get_name(); }
    Severity get_severity() const { return first_info().get_severity(); }
    const std::optional<Url>& get_url() const { return first_info().get_url(); }
    const std::string& get_token_name() const { return first_info().get_token_name(); }
    const std::optional<DataContainer>& get_dc() const { return first_info().get_dc(); }

    std::string get_uniq_id() const;

private:
    std::vector<GroupMember> infos_;
    std::string itag_;
};

// Живые ресурсы сканера, которые нужны Shell. Не сериализуются.
class UrlOpener {
public:
    virtual ~UrlOpener() = default;
    virtual std::string send(const std::string& method, const Url& url, const std::string& body) = 0;
};

class WorkerPool {
public:
    virtual ~WorkerPool() = default;
    virtual void submit(std::function<void()> task) = 0;
};

// Сессия на эксплуатированной уязвимости. После чтения из базы
// url_opener и worker_pool нужно подключить заново.
class Shell {
public:
    Shell(Vuln vuln, std::string shell_name, std::string state = "");

    const Vuln& get_vuln() const { return vuln_; }
    const std::string& get_name() const { return shell_name_; }
    const std::string& get_state() const { return state_; }
    void set_state(const std::string& state) { state_ = state; }

    const std::optional<Url>& get_url() const { return vuln_.get_url(); }
    const std::string& get_token_name() const { return vuln_.get_token_name(); }
    const std::optional<DataContainer>& get_dc() const { return vuln_.get_dc(); }

    void set_url_opener(std::shared_ptr<UrlOpener> opener) { opener_ = std::move(opener); }
    void set_worker_pool(std::shared_ptr<WorkerPool> pool) { pool_ = std::move(pool); }
    const std::shared_ptr<UrlOpener>& url_opener() const { return opener_; }
    const std::shared_ptr<WorkerPool>& worker_pool() const { return pool_; }
    bool is_live() const { return opener_ && pool_; }

    std::string get_uniq_id() const;

private:
    Vuln vuln_;
    std::string shell_name_;
    std::string state_;
    std::shared_ptr<UrlOpener> opener_;
    std::shared_ptr<WorkerPool> pool_;
};

using Finding = std::variant<Info, Vuln, InfoSet, Shell>;

enum class FindingKind { Info, Vuln, InfoSet, Shell };

FindingKind finding_kind(const Finding& f);
const char* finding_kind_name(FindingKind kind);

std::string finding_uniq_id(const Finding& f);
std::optional<Url> finding_url(const Finding& f);
std::string finding_token_name(const Finding& f);
std::optional<DataContainer> finding_dc(const Finding& f);
// У Shell критичности нет.
std::optional<Severity> finding_severity(const Finding& f);
