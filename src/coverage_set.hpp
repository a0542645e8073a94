#pragma once
#include "finding_codec.hpp"
#include "kb_backend.hpp"
#include "url.hpp"

#include <memory>
#include <string>
#include <vector>

template <typename T> struct CoverageTraits;

template <> struct CoverageTraits<Url> {
    static std::string key(const Url& url) { return url.str(); }
    static std::string encode(const Url& url) { return encode_url(url); }
    static Url decode(const std::string& blob) { return decode_url(blob); }
};

template <> struct CoverageTraits<FuzzableRequest> {
    static std::string key(const FuzzableRequest& req) { return req.shape_key(); }
    static std::string encode(const FuzzableRequest& req) { return encode_request(req); }
    static FuzzableRequest decode(const std::string& blob) { return decode_request(blob); }
};

// Типизированная обёртка над DiskSet: известные URL или формы запросов.
template <typename T>
class CoverageSet {
public:
    explicit CoverageSet(std::unique_ptr<DiskSet> set) : set_(std::move(set)) {}

    bool add(const T& item) {
        return set_->add(CoverageTraits<T>::key(item), CoverageTraits<T>::encode(item));
    }

    std::vector<T> items() const {
        std::vector<T> out;
        for (const auto& blob : set_->items()) out.push_back(CoverageTraits<T>::decode(blob));
        return out;
    }

    void cleanup() { set_->cleanup(); }

private:
    std::unique_ptr<DiskSet> set_;
};
