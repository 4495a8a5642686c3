#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <map>
#include <memory>
#include <variant>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>

namespace keystone {

// ============================================================================
// Error taxonomy
// ============================================================================

class keystone_error : public std::runtime_error {
public:
    explicit keystone_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Null/choice/type violations, unknown fields, malformed predicates.
class validation_error : public keystone_error {
public:
    explicit validation_error(const std::string& msg) : keystone_error(msg) {}
};

/// A reference could not be resolved to its target record(s).
/// Never suppressed by lenient deserialization.
class relation_error : public validation_error {
public:
    explicit relation_error(const std::string& msg) : validation_error(msg) {}
};

/// Unusable store configuration. Raised once, when the context is built.
class configuration_error : public keystone_error {
public:
    explicit configuration_error(const std::string& msg) : keystone_error(msg) {}
};

/// A store round trip failed.
class store_error : public keystone_error {
public:
    explicit store_error(const std::string& msg) : keystone_error(msg) {}
};

// ============================================================================
// Value types
// ============================================================================

// Record identifier, issued by id_allocator
using model_id_t = int64_t;

// Absolute point in time; serialized in UTC with second precision
using timestamp_t = std::chrono::system_clock::time_point;

// Calendar date without a time of day
struct date_t {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    date_t() = default;

    date_t(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {}

    // UTC calendar date of a timestamp
    static date_t from_timestamp(timestamp_t ts);

    bool is_valid() const;

    bool operator==(const date_t& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const date_t& other) const {
        return !(*this == other);
    }

    bool operator<(const date_t& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

// Arbitrary-precision decimal (50 significant digits)
struct decimal_t {
    using number_type = boost::multiprecision::cpp_dec_float_50;

    number_type number;

    decimal_t() = default;

    explicit decimal_t(const std::string& text);
    explicit decimal_t(int64_t v) : number(v) {}
    // Uses the shortest decimal text that round-trips the double (1.1 -> "1.1")
    explicit decimal_t(double v);

    std::string to_string() const;
    double to_double() const { return number.convert_to<double>(); }

    bool operator==(const decimal_t& other) const { return number == other.number; }
    bool operator!=(const decimal_t& other) const { return number != other.number; }
    bool operator<(const decimal_t& other) const { return number < other.number; }
};

// Composite document held by Json/Dict/List fields
struct json_value {
    nlohmann::json doc;

    json_value() = default;
    explicit json_value(nlohmann::json d) : doc(std::move(d)) {}

    bool operator==(const json_value& other) const { return doc == other.doc; }
    bool operator!=(const json_value& other) const { return doc != other.doc; }
};

class model_instance;
using instance_ptr = std::shared_ptr<model_instance>;
using instance_list = std::vector<instance_ptr>;

// Typed field value. std::monostate is null.
using value_t = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    decimal_t,
    json_value,
    timestamp_t,
    date_t,
    instance_ptr,    // single reference
    instance_list    // multi reference
>;

// Field name -> value, as passed to create/make/update
using value_map = std::map<std::string, value_t>;

// ============================================================================
// Helpers
// ============================================================================

inline bool is_null(const value_t& v) {
    return std::holds_alternative<std::monostate>(v);
}

// Short type name for error messages ("int", "string", "instance", ...)
const char* type_name(const value_t& v);

// Human readable rendering; also the coercion used by String fields
std::string to_display_string(const value_t& v);

// Equality used by filters: numbers compare across int/float/decimal,
// references compare by model name and id (or against a bare id).
bool values_equal(const value_t& a, const value_t& b);

// Three-way comparison; nullopt when the two values are not comparable.
std::optional<int> compare_values(const value_t& a, const value_t& b);

// Scalar JSON -> value (string, int, float, bool, null); objects and arrays
// become json_value.
value_t value_from_json(const nlohmann::json& j);

// Value -> JSON as returned by projections. References become ids.
nlohmann::json value_to_json(const value_t& v);

// Current time truncated to whole seconds
timestamp_t now_utc();

// "YYYY.MM.DD-HH:MM:SS+UTC"
std::string format_datetime(timestamp_t ts);
std::optional<timestamp_t> parse_datetime(const std::string& text);

// "YYYY.MM.DD"
std::string format_date(const date_t& d);
std::optional<date_t> parse_date(const std::string& text);

} // namespace keystone

#endif // __cplusplus
