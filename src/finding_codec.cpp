#include "finding_codec.hpp"
#include "crypto.hpp"
#include "kb_errors.hpp"

#include <cstdint>
#include <vector>

using nlohmann::json;

static std::string to_blob(const json& j) {
    const std::vector<std::uint8_t> bytes = json::to_cbor(j);
    return std::string(bytes.begin(), bytes.end());
}

static std::string string_form(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    // вложенные строки могут быть не UTF-8, dump() на них бросает
    if (v.is_structured()) return to_blob(v);
    return v.dump();
}

std::string raw_uniq_id(const RawValue& value) {
    std::string concat;
    if (value.is_array()) {
        for (const auto& el : value) concat += string_form(el);
    } else if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) concat += it.key();
    } else {
        concat = string_form(value);
    }
    return sha256_hex(concat);
}

std::string value_uniq_id(const KbValue& value) {
    if (const auto* f = std::get_if<Finding>(&value)) return finding_uniq_id(*f);
    return raw_uniq_id(std::get<RawValue>(value));
}

// ---------------- Info / Vuln ----------------

static json encode_dc(const DataContainer& dc) {
    json params = json::array();
    for (const auto& [k, v] : dc.params()) params.push_back(json::array({k, v}));
    return params;
}

static DataContainer decode_dc(const json& j) {
    std::vector<DataContainer::Param> params;
    for (const auto& p : j) params.emplace_back(p.at(0).get<std::string>(), p.at(1).get<std::string>());
    return DataContainer(std::move(params));
}

static json encode_info(const Info& i) {
    json j;
    j["name"] = i.get_name();
    j["desc"] = i.get_desc();
    j["severity"] = severity_to_string(i.get_severity());
    j["plugin"] = i.get_plugin_name();
    j["url"] = i.get_url() ? json(i.get_url()->str()) : json(nullptr);
    j["token"] = i.get_token_name();
    j["dc"] = i.get_dc() ? encode_dc(*i.get_dc()) : json(nullptr);
    j["ids"] = i.get_ids();
    j["attrs"] = i.attrs();
    return j;
}

static Info decode_info(const json& j) {
    Info i(j.at("name").get<std::string>(),
           j.at("desc").get<std::string>(),
           severity_from_string(j.at("severity").get<std::string>()),
           j.at("plugin").get<std::string>());
    if (!j.at("url").is_null()) i.set_url(Url(j.at("url").get<std::string>()));
    i.set_token_name(j.at("token").get<std::string>());
    if (!j.at("dc").is_null()) i.set_dc(decode_dc(j.at("dc")));
    for (int id : j.at("ids").get<std::vector<int>>()) i.add_id(id);
    for (const auto& [k, v] : j.at("attrs").get<std::map<std::string, std::string>>()) i.set_attr(k, v);
    return i;
}

static json encode_member(const GroupMember& m) {
    json j;
    j["kind"] = std::holds_alternative<Vuln>(m) ? "vuln" : "info";
    j["data"] = encode_info(as_info(m));
    return j;
}

static GroupMember decode_member(const json& j) {
    Info i = decode_info(j.at("data"));
    if (j.at("kind").get<std::string>() == "vuln") return Vuln(i);
    return i;
}

// ---------------- Finding ----------------

json encode_finding(const Finding& f) {
    json j;
    switch (finding_kind(f)) {
        case FindingKind::Info:
            j["kind"] = "info";
            j["data"] = encode_info(std::get<Info>(f));
            break;
        case FindingKind::Vuln:
            j["kind"] = "vuln";
            j["data"] = encode_info(std::get<Vuln>(f));
            break;
        case FindingKind::InfoSet: {
            const auto& s = std::get<InfoSet>(f);
            json members = json::array();
            for (const auto& m : s.infos()) members.push_back(encode_member(m));
            j["kind"] = "info_set";
            j["data"] = {{"itag", s.get_itag()}, {"infos", members}};
            break;
        }
        case FindingKind::Shell: {
            // живые ресурсы (opener, pool) не сохраняем
            const auto& s = std::get<Shell>(f);
            j["kind"] = "shell";
            j["data"] = {{"name", s.get_name()},
                         {"state", s.get_state()},
                         {"vuln", encode_info(s.get_vuln())}};
            break;
        }
    }
    return j;
}

Finding decode_finding(const json& j) {
    const std::string kind = j.at("kind").get<std::string>();
    const json& data = j.at("data");

    if (kind == "info") return decode_info(data);
    if (kind == "vuln") return Vuln(decode_info(data));
    if (kind == "info_set") {
        std::vector<GroupMember> members;
        for (const auto& m : data.at("infos")) members.push_back(decode_member(m));
        return InfoSet(std::move(members), data.at("itag").get<std::string>());
    }
    if (kind == "shell") {
        return Shell(Vuln(decode_info(data.at("vuln"))),
                     data.at("name").get<std::string>(),
                     data.at("state").get<std::string>());
    }
    throw KbCodecError("Неизвестный тип находки: " + kind);
}

std::string encode_value(const KbValue& value) {
    if (const auto* f = std::get_if<Finding>(&value)) return to_blob(encode_finding(*f));

    json j;
    j["kind"] = "raw";
    j["data"] = std::get<RawValue>(value);
    return to_blob(j);
}

KbValue decode_value(const std::string& blob) {
    try {
        json j = json::from_cbor(blob);
        if (j.at("kind").get<std::string>() == "raw") return KbValue(std::in_place_type<RawValue>, j.at("data"));
        return KbValue(std::in_place_type<Finding>, decode_finding(j));
    } catch (const json::exception& e) {
        throw KbCodecError(std::string("Повреждённая запись базы знаний: ") + e.what());
    } catch (const KbTypeError& e) {
        // сохранённое значение не проходит проверки типов
        throw KbCodecError(std::string("Повреждённая запись базы знаний: ") + e.what());
    }
}

// ---------------- coverage ----------------

std::string encode_url(const Url& url) {
    return url.str();
}

Url decode_url(const std::string& blob) {
    try {
        return Url(blob);
    } catch (const KbTypeError& e) {
        throw KbCodecError(std::string("Повреждённый URL в наборе покрытия: ") + e.what());
    }
}

std::string encode_request(const FuzzableRequest& req) {
    json j;
    j["method"] = req.get_method();
    j["url"] = req.get_url().str();
    j["dc"] = encode_dc(req.get_dc());
    return to_blob(j);
}

FuzzableRequest decode_request(const std::string& blob) {
    try {
        json j = json::from_cbor(blob);
        return FuzzableRequest(Url(j.at("url").get<std::string>()),
                               j.at("method").get<std::string>(),
                               decode_dc(j.at("dc")));
    } catch (const json::exception& e) {
        throw KbCodecError(std::string("Повреждённый запрос в наборе покрытия: ") + e.what());
    } catch (const KbTypeError& e) {
        throw KbCodecError(std::string("Повреждённый запрос в наборе покрытия: ") + e.what());
    }
}
