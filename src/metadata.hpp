#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

// Scalar metadata value
using MetaValue = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

using MetaFilter = std::map<std::string, MetaValue>;

// Ints and doubles compare numerically, so 3 == 3.0
bool meta_equal(const MetaValue& a, const MetaValue& b);

std::string meta_to_string(const MetaValue& value);

nlohmann::json meta_to_json(const MetaValue& value);

// Throws std::invalid_argument for arrays and objects
MetaValue meta_from_json(const nlohmann::json& value);

MetaFilter filter_from_json(const nlohmann::json& value);

// Document metadata: the fields the engine filters and boosts on are typed,
// anything else lands in extra.
struct Metadata {
    std::optional<std::string> chunk_type;
    std::optional<std::string> table_name;
    std::optional<std::string> column_name;
    std::optional<std::string> metric_name;
    std::optional<std::string> source;
    std::map<std::string, MetaValue> extra;

    // Looks up known fields by name, then extra
    std::optional<MetaValue> get(const std::string& key) const;

    // Known field names only accept strings (or null to clear)
    void set(const std::string& key, const MetaValue& value);

    bool contains(const std::string& key) const { return get(key).has_value(); }

    // Equality on every filter key; a missing key never matches
    bool matches(const MetaFilter& filter) const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    nlohmann::json to_json() const;
    static Metadata from_json(const nlohmann::json& value);
};
