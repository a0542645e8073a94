#pragma once
#include "finding.hpp"
#include "url.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

// Всё, что не является находкой, хранится как JSON-документ.
using RawValue = nlohmann::json;
using KbValue = std::variant<Finding, RawValue>;

inline bool is_finding(const KbValue& v) { return std::holds_alternative<Finding>(v); }

inline KbValue raw_value(RawValue v) { return KbValue(std::in_place_type<RawValue>, std::move(v)); }

// uniq_id сырого значения: массив -> хеш конкатенации строковых форм
// элементов, объект -> хеш конкатенации ключей, скаляр -> хеш значения.
std::string raw_uniq_id(const RawValue& value);
std::string value_uniq_id(const KbValue& value);

nlohmann::json encode_finding(const Finding& f);
Finding decode_finding(const nlohmann::json& j);

// blob записи: CBOR конверта {"kind": ..., "data": ...}. Строки
// сохраняются байт в байт, UTF-8 не требуется.
std::string encode_value(const KbValue& value);
KbValue decode_value(const std::string& blob);

std::string encode_url(const Url& url);
Url decode_url(const std::string& blob);
// CBOR: значения параметров могут быть произвольными байтами
std::string encode_request(const FuzzableRequest& req);
FuzzableRequest decode_request(const std::string& blob);
