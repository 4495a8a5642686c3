#include "keystone/types.hpp"
#include "keystone/model.hpp"
#include <charconv>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace keystone {

namespace {

constexpr const char* k_datetime_format = "%Y.%m.%d-%H:%M:%S+UTC";
constexpr const char* k_date_format = "%Y.%m.%d";

std::string shortest_double_text(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc()) {
        std::ostringstream ss;
        ss.precision(17);
        ss << v;
        return ss.str();
    }
    return std::string(buf, res.ptr);
}

bool is_numeric(const value_t& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v) ||
           std::holds_alternative<decimal_t>(v) || std::holds_alternative<bool>(v);
}

decimal_t to_decimal(const value_t& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return decimal_t(*i);
    if (auto* d = std::get_if<double>(&v)) return decimal_t(*d);
    if (auto* b = std::get_if<bool>(&v)) return decimal_t(static_cast<int64_t>(*b ? 1 : 0));
    return std::get<decimal_t>(v);
}

double to_double(const value_t& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto* d = std::get_if<double>(&v)) return *d;
    if (auto* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    return std::get<decimal_t>(v).to_double();
}

template<typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

std::optional<int> compare_numbers(const value_t& a, const value_t& b) {
    if (std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b)) {
        return three_way(std::get<bool>(a), std::get<bool>(b));
    }
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        return three_way(std::get<int64_t>(a), std::get<int64_t>(b));
    }
    if (std::holds_alternative<decimal_t>(a) || std::holds_alternative<decimal_t>(b)) {
        return three_way(to_decimal(a), to_decimal(b));
    }
    return three_way(to_double(a), to_double(b));
}

std::optional<model_id_t> reference_id(const value_t& v) {
    if (auto* p = std::get_if<instance_ptr>(&v)) {
        if (*p) return (*p)->id();
        return std::nullopt;
    }
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    return std::nullopt;
}

} // namespace

// ============================================================================
// date_t / decimal_t
// ============================================================================

date_t date_t::from_timestamp(timestamp_t ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return date_t(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
}

bool date_t::is_valid() const {
    static const unsigned days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    unsigned limit = days_in_month[month - 1] + ((month == 2 && leap) ? 1 : 0);
    return day <= limit;
}

decimal_t::decimal_t(const std::string& text) {
    try {
        number = number_type(text.c_str());
    } catch (const std::runtime_error&) {
        throw validation_error("'" + text + "' is not a valid decimal");
    }
}

decimal_t::decimal_t(double v) : number(shortest_double_text(v).c_str()) {}

std::string decimal_t::to_string() const {
    return number.str();
}

// ============================================================================
// Value helpers
// ============================================================================

const char* type_name(const value_t& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "string";
        case 5: return "decimal";
        case 6: return "json";
        case 7: return "datetime";
        case 8: return "date";
        case 9: return "instance";
        case 10: return "instance list";
        default: return "unknown";
    }
}

std::string to_display_string(const value_t& v) {
    return std::visit([](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return shortest_double_text(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, decimal_t>) {
            return x.to_string();
        } else if constexpr (std::is_same_v<T, json_value>) {
            return x.doc.dump();
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_datetime(x);
        } else if constexpr (std::is_same_v<T, date_t>) {
            return format_date(x);
        } else if constexpr (std::is_same_v<T, instance_ptr>) {
            if (!x) return "null";
            auto id = x->id();
            return x->model_name() + "#" + (id ? std::to_string(*id) : std::string("unsaved"));
        } else {
            std::string out = "[";
            for (size_t i = 0; i < x.size(); ++i) {
                if (i) out += ", ";
                out += to_display_string(value_t(x[i]));
            }
            return out + "]";
        }
    }, v);
}

std::optional<int> compare_values(const value_t& a, const value_t& b) {
    if (is_null(a) && is_null(b)) return 0;
    if (is_null(a) || is_null(b)) return std::nullopt;

    if (is_numeric(a) && is_numeric(b)) {
        return compare_numbers(a, b);
    }
    if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
        int c = std::get<std::string>(a).compare(std::get<std::string>(b));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (std::holds_alternative<timestamp_t>(a) && std::holds_alternative<timestamp_t>(b)) {
        return three_way(std::get<timestamp_t>(a), std::get<timestamp_t>(b));
    }
    if (std::holds_alternative<date_t>(a) && std::holds_alternative<date_t>(b)) {
        return three_way(std::get<date_t>(a), std::get<date_t>(b));
    }
    if (std::holds_alternative<instance_ptr>(a) || std::holds_alternative<instance_ptr>(b)) {
        auto* pa = std::get_if<instance_ptr>(&a);
        auto* pb = std::get_if<instance_ptr>(&b);
        if (pa && pb && *pa && *pb && (*pa)->model_name() != (*pb)->model_name()) {
            return std::nullopt;
        }
        auto ia = reference_id(a);
        auto ib = reference_id(b);
        if (!ia || !ib) return std::nullopt;
        return three_way(*ia, *ib);
    }
    if (std::holds_alternative<json_value>(a) && std::holds_alternative<json_value>(b)) {
        if (std::get<json_value>(a) == std::get<json_value>(b)) return 0;
        return std::nullopt;
    }
    if (std::holds_alternative<instance_list>(a) && std::holds_alternative<instance_list>(b)) {
        const auto& la = std::get<instance_list>(a);
        const auto& lb = std::get<instance_list>(b);
        if (la.size() != lb.size()) return std::nullopt;
        for (size_t i = 0; i < la.size(); ++i) {
            if (!values_equal(value_t(la[i]), value_t(lb[i]))) return std::nullopt;
        }
        return 0;
    }
    return std::nullopt;
}

bool values_equal(const value_t& a, const value_t& b) {
    auto c = compare_values(a, b);
    return c.has_value() && *c == 0;
}

value_t value_from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return std::monostate{};
        case nlohmann::json::value_t::boolean:
            return j.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            return j.get<int64_t>();
        case nlohmann::json::value_t::number_float:
            return j.get<double>();
        case nlohmann::json::value_t::string:
            return j.get<std::string>();
        default:
            return json_value(j);
    }
}

nlohmann::json value_to_json(const value_t& v) {
    return std::visit([](auto&& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, decimal_t>) {
            return x.to_double();
        } else if constexpr (std::is_same_v<T, json_value>) {
            return x.doc;
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_datetime(x);
        } else if constexpr (std::is_same_v<T, date_t>) {
            return format_date(x);
        } else if constexpr (std::is_same_v<T, instance_ptr>) {
            if (!x || !x->id()) return nullptr;
            return *x->id();
        } else {
            nlohmann::json ids = nlohmann::json::array();
            for (const auto& item : x) {
                if (item && item->id()) ids.push_back(*item->id());
            }
            return ids;
        }
    }, v);
}

// ============================================================================
// Date/time formatting
// ============================================================================

timestamp_t now_utc() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::string format_datetime(timestamp_t ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(ts));
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), k_datetime_format, &tm);
    return std::string(buf, n);
}

std::optional<timestamp_t> parse_datetime(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), k_datetime_format, &tm);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_date(const date_t& d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d.%02u.%02u", d.year, d.month, d.day);
    return buf;
}

std::optional<date_t> parse_date(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), k_date_format, &tm);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    date_t d(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
    if (!d.is_valid()) return std::nullopt;
    return d;
}

} // namespace keystone
