#pragma once
#include <set>
#include <string>
#include <utility>
#include <vector>

// URL, приведённый к канонической форме: схема и хост в нижнем регистре,
// без фрагмента, пустой путь заменяется на "/".
class Url {
public:
    explicit Url(const std::string& raw);

    const std::string& str() const { return normalized_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    // путь вместе со строкой запроса
    const std::string& path() const { return path_; }

    bool operator==(const Url& other) const { return normalized_ == other.normalized_; }
    bool operator!=(const Url& other) const { return !(*this == other); }
    bool operator<(const Url& other) const { return normalized_ < other.normalized_; }

private:
    std::string scheme_;
    std::string host_;
    std::string path_;
    std::string normalized_;
};

// Параметры запроса в порядке появления. Набор ключей задаёт "форму" запроса.
class DataContainer {
public:
    using Param = std::pair<std::string, std::string>;

    DataContainer() = default;
    explicit DataContainer(std::vector<Param> params) : params_(std::move(params)) {}

    void set(const std::string& name, const std::string& value);
    const std::vector<Param>& params() const { return params_; }
    std::set<std::string> key_set() const;
    bool empty() const { return params_.empty(); }

    bool operator==(const DataContainer& other) const { return params_ == other.params_; }

private:
    std::vector<Param> params_;
};

class FuzzableRequest {
public:
    FuzzableRequest(Url url, std::string method = "GET", DataContainer dc = {});

    const Url& get_url() const { return url_; }
    const std::string& get_method() const { return method_; }
    const DataContainer& get_dc() const { return dc_; }

    // Метод + URL без строки запроса + отсортированные имена параметров.
    std::string shape_key() const;

private:
    Url url_;
    std::string method_;
    DataContainer dc_;
};
