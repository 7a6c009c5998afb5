#include "metadata.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace {

std::optional<std::string> Metadata::* known_field(const std::string& key) {
    if (key == "chunk_type") return &Metadata::chunk_type;
    if (key == "table_name") return &Metadata::table_name;
    if (key == "column_name") return &Metadata::column_name;
    if (key == "metric_name") return &Metadata::metric_name;
    if (key == "source") return &Metadata::source;
    return nullptr;
}

const char* const kKnownFields[] = {
    "chunk_type", "table_name", "column_name", "metric_name", "source"
};

bool is_number(const MetaValue& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v);
}

double as_double(const MetaValue& v) {
    if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
    return std::get<double>(v);
}

}

bool meta_equal(const MetaValue& a, const MetaValue& b) {
    if (is_number(a) && is_number(b)) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return std::get<int64_t>(a) == std::get<int64_t>(b);
        }
        return as_double(a) == as_double(b);
    }
    return a == b;
}

std::string meta_to_string(const MetaValue& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) return "null";
    if (std::holds_alternative<bool>(value)) return std::get<bool>(value) ? "true" : "false";
    if (std::holds_alternative<int64_t>(value)) return std::to_string(std::get<int64_t>(value));
    if (std::holds_alternative<double>(value)) {
        std::ostringstream ss;
        ss << std::get<double>(value);
        return ss.str();
    }
    return std::get<std::string>(value);
}

nlohmann::json meta_to_json(const MetaValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json { return nlohmann::json(v); }, value);
}

MetaValue meta_from_json(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned:
            return static_cast<int64_t>(value.get<uint64_t>());
        case nlohmann::json::value_t::number_float:
            return value.get<double>();
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        default:
            throw std::invalid_argument("metadata values must be scalars, got " +
                                        std::string(value.type_name()));
    }
}

MetaFilter filter_from_json(const nlohmann::json& value) {
    MetaFilter filter;
    if (value.is_null()) return filter;
    if (!value.is_object()) {
        throw std::invalid_argument("filter must be an object");
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        filter[it.key()] = meta_from_json(it.value());
    }
    return filter;
}

std::optional<MetaValue> Metadata::get(const std::string& key) const {
    if (auto field = known_field(key)) {
        const auto& slot = this->*field;
        if (slot) return MetaValue(*slot);
    }
    auto it = extra.find(key);
    if (it == extra.end()) return std::nullopt;
    return it->second;
}

void Metadata::set(const std::string& key, const MetaValue& value) {
    if (auto field = known_field(key)) {
        if (std::holds_alternative<std::nullptr_t>(value)) {
            (this->*field).reset();
        } else if (std::holds_alternative<std::string>(value)) {
            this->*field = std::get<std::string>(value);
        } else {
            throw std::invalid_argument("metadata field '" + key + "' must be a string");
        }
        return;
    }
    extra[key] = value;
}

bool Metadata::matches(const MetaFilter& filter) const {
    for (const auto& [key, expected] : filter) {
        auto actual = get(key);
        if (!actual || !meta_equal(*actual, expected)) {
            return false;
        }
    }
    return true;
}

size_t Metadata::size() const {
    size_t n = extra.size();
    for (const char* name : kKnownFields) {
        if ((this->*known_field(name)).has_value()) n++;
    }
    return n;
}

nlohmann::json Metadata::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const char* name : kKnownFields) {
        const auto& slot = this->*known_field(name);
        if (slot) j[name] = *slot;
    }
    for (const auto& [key, value] : extra) {
        j[key] = meta_to_json(value);
    }
    return j;
}

Metadata Metadata::from_json(const nlohmann::json& value) {
    Metadata meta;
    if (value.is_null()) return meta;
    if (!value.is_object()) {
        throw std::invalid_argument("metadata must be an object");
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        MetaValue v = meta_from_json(it.value());
        if (known_field(it.key()) && !std::holds_alternative<std::string>(v)
            && !std::holds_alternative<std::nullptr_t>(v)) {
            // Non-string value under a known name: keep it generic
            meta.extra[it.key()] = v;
            continue;
        }
        meta.set(it.key(), v);
    }
    return meta;
}
