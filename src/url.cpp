#include "url.hpp"
#include "kb_errors.hpp"

#include <algorithm>
#include <cctype>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

Url::Url(const std::string& raw) {
    std::string s = trim(raw);

    auto sep = s.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw KbTypeError("Не URL: " + raw);
    }
    scheme_ = to_lower(s.substr(0, sep));

    std::string rest = s.substr(sep + 3);
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);

    auto slash = rest.find_first_of("/?");
    host_ = to_lower(rest.substr(0, slash));
    if (host_.empty()) {
        throw KbTypeError("URL без хоста: " + raw);
    }

    path_ = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (path_.front() == '?') path_.insert(path_.begin(), '/');

    normalized_ = scheme_ + "://" + host_ + path_;
}

void DataContainer::set(const std::string& name, const std::string& value) {
    for (auto& p : params_) {
        if (p.first == name) {
            p.second = value;
            return;
        }
    }
    params_.emplace_back(name, value);
}

std::set<std::string> DataContainer::key_set() const {
    std::set<std::string> keys;
    for (const auto& p : params_) keys.insert(p.first);
    return keys;
}

FuzzableRequest::FuzzableRequest(Url url, std::string method, DataContainer dc)
    : url_(std::move(url)), method_(std::move(method)), dc_(std::move(dc)) {
    std::transform(method_.begin(), method_.end(), method_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
}

std::string FuzzableRequest::shape_key() const {
    std::string base = url_.str();
    auto q = base.find('?');
    std::set<std::string> names = dc_.key_set();
    if (q != std::string::npos) {
        // имена параметров из строки запроса тоже входят в форму
        std::string query = base.substr(q + 1);
        base.erase(q);
        std::size_t pos = 0;
        while (pos <= query.size()) {
            auto amp = query.find('&', pos);
            std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (!pair.empty()) names.insert(pair.substr(0, pair.find('=')));
            if (amp == std::string::npos) break;
            pos = amp + 1;
        }
    }

    std::string key = method_ + " " + base;
    for (const auto& n : names) key += "|" + n;
    return key;
}
