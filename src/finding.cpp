#include "finding.hpp"
#include "crypto.hpp"
#include "kb_errors.hpp"

#include <type_traits>

Info::Info(std::string name, std::string description, Severity severity, std::string plugin_name)
    : name_(std::move(name)),
      description_(std::move(description)),
      severity_(severity),
      plugin_name_(std::move(plugin_name)) {}

std::string Info::get_attr(const std::string& name) const {
    auto it = attrs_.find(name);
    return it == attrs_.end() ? std::string() : it->second;
}

std::string Info::identity_material(const char* kind) const {
    // '\x1f' разделяет поля, чтобы "ab"+"c" не совпало с "a"+"bc"
    std::string m = kind;
    m += '\x1f' + name_;
    m += '\x1f' + severity_to_string(severity_);
    m += '\x1f' + (url_ ? url_->str() : std::string());
    m += '\x1f' + token_name_;
    m += '\x1f';
    if (dc_) {
        for (const auto& [k, v] : dc_->params()) m += k + "=" + v + "&";
    }
    m += '\x1f' + description_;
    m += '\x1f' + plugin_name_;
    for (const auto& [k, v] : attrs_) m += '\x1f' + k + "=" + v;
    return m;
}

std::string Info::get_uniq_id() const {
    return sha256_hex(identity_material("info"));
}

Vuln::Vuln(std::string name, std::string description, Severity severity, std::string plugin_name)
    : Info(std::move(name), std::move(description), severity, std::move(plugin_name)) {
    if (!is_vuln_severity(severity)) {
        throw KbTypeError("Уязвимость не может иметь критичность Information");
    }
}

Vuln::Vuln(const Info& info) : Info(info) {
    if (!is_vuln_severity(info.get_severity())) {
        throw KbTypeError("Уязвимость не может иметь критичность Information");
    }
}

void Vuln::set_severity(Severity s) {
    if (!is_vuln_severity(s)) {
        throw KbTypeError("Уязвимость не может иметь критичность Information");
    }
    Info::set_severity(s);
}

std::string Vuln::get_uniq_id() const {
    return sha256_hex(identity_material("vuln"));
}

const Info& as_info(const GroupMember& member) {
    return std::visit([](const auto& m) -> const Info& { return m; }, member);
}

static std::string member_uniq_id(const GroupMember& member) {
    return std::visit([](const auto& m) { return m.get_uniq_id(); }, member);
}

InfoSet::InfoSet(std::vector<GroupMember> infos, std::string itag)
    : infos_(std::move(infos)), itag_(std::move(itag)) {
    if (infos_.empty()) {
        throw KbTypeError("InfoSet требует хотя бы одну находку");
    }
}

bool InfoSet::match(const Info& info) const {
    const Info& first = first_info();
    if (first.get_name() != info.get_name()) return false;
    if (itag_.empty()) return true;
    return first.get_attr(itag_) == info.get_attr(itag_);
}

void InfoSet::add(const GroupMember& info) {
    infos_.push_back(info);
}

std::string InfoSet::get_uniq_id() const {
    std::string concat = "info_set\x1f" + itag_;
    for (const auto& m : infos_) concat += '\x1f' + member_uniq_id(m);
    return sha256_hex(concat);
}

Shell::Shell(Vuln vuln, std::string shell_name, std::string state)
    : vuln_(std::move(vuln)), shell_name_(std::move(shell_name)), state_(std::move(state)) {}

std::string Shell::get_uniq_id() const {
    return sha256_hex("shell\x1f" + shell_name_ + '\x1f' + vuln_.get_uniq_id() + '\x1f' + state_);
}

FindingKind finding_kind(const Finding& f) {
    switch (f.index()) {
        case 0: return FindingKind::Info;
        case 1: return FindingKind::Vuln;
        case 2: return FindingKind::InfoSet;
        default: return FindingKind::Shell;
    }
}

const char* finding_kind_name(FindingKind kind) {
    switch (kind) {
        case FindingKind::Info:    return "Info";
        case FindingKind::Vuln:    return "Vuln";
        case FindingKind::InfoSet: return "InfoSet";
        case FindingKind::Shell:   return "Shell";
    }
    return "Info";
}

std::string finding_uniq_id(const Finding& f) {
    return std::visit([](const auto& v) { return v.get_uniq_id(); }, f);
}

std::optional<Url> finding_url(const Finding& f) {
    return std::visit([](const auto& v) { return v.get_url(); }, f);
}

std::string finding_token_name(const Finding& f) {
    return std::visit([](const auto& v) { return v.get_token_name(); }, f);
}

std::optional<DataContainer> finding_dc(const Finding& f) {
    return std::visit([](const auto& v) { return v.get_dc(); }, f);
}

std::optional<Severity> finding_severity(const Finding& f) {
    return std::visit([](const auto& v) -> std::optional<Severity> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Shell>) {
            return std::nullopt;
        } else {
            return v.get_severity();
        }
    }, f);
}
