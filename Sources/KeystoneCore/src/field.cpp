#include "keystone/field.hpp"
#include "keystone/model.hpp"
#include "keystone/log.hpp"
#include <cmath>

namespace keystone {

namespace {

// NaN and infinities have no JSON form; nlohmann would write them as null
double finite(double d) {
    if (!std::isfinite(d)) {
        throw validation_error(std::to_string(d) + " is not a finite number");
    }
    return d;
}

} // namespace

const char* to_string(field_kind kind) {
    switch (kind) {
        case field_kind::string: return "String";
        case field_kind::number: return "Number";
        case field_kind::id: return "Id";
        case field_kind::boolean: return "Boolean";
        case field_kind::decimal: return "Decimal";
        case field_kind::json: return "Json";
        case field_kind::dict: return "Dict";
        case field_kind::list: return "List";
        case field_kind::datetime: return "DateTime";
        case field_kind::date: return "Date";
        case field_kind::reference: return "Reference";
        case field_kind::multi_reference: return "MultiReference";
        case field_kind::raw: return "Raw";
    }
    return "Unknown";
}

// ============================================================================
// field_spec
// ============================================================================

field_spec::field_spec(field_kind kind, field_options options)
    : options_(std::move(options)), kind_(kind) {}

bool field_spec::has_default() const {
    return static_cast<bool>(options_.generator) || !is_null(options_.default_value);
}

value_t field_spec::resolve_default() const {
    if (options_.generator) {
        return options_.generator();
    }
    return options_.default_value;
}

nlohmann::json field_spec::clean() {
    if (is_null(value_)) {
        value_ = resolve_default();
    }
    if (is_null(value_)) {
        if (!nullable()) {
            throw validation_error("null is not allowed");
        }
        return nullptr;
    }
    check_choices(value_);
    nlohmann::json serialized = serialize(value_);
    value_ = normalize(value_);
    return serialized;
}

value_t field_spec::deserialize(const nlohmann::json& raw, const deserialize_context& ctx) const {
    if (raw.is_null()) {
        if (!nullable()) {
            LOG_WARN("field", "null can not be deserialized as %s, ignoring", to_string(kind_));
            if (!ctx.lenient) {
                throw validation_error(std::string("null can not be deserialized as ") + to_string(kind_));
            }
        }
        return std::monostate{};
    }
    if (!ctx.lenient) {
        return parse(raw, ctx);
    }
    try {
        return parse(raw, ctx);
    } catch (const relation_error&) {
        throw;
    } catch (const validation_error& e) {
        LOG_WARN("field", "%s, ignoring", e.what());
        return std::monostate{};
    }
}

void field_spec::check_choices(const value_t& v) const {
    if (!options_.choices) return;
    std::string allowed;
    for (const auto& [choice, label] : *options_.choices) {
        if (values_equal(v, choice)) return;
        if (!allowed.empty()) allowed += ", ";
        allowed += to_display_string(choice);
    }
    throw validation_error(to_display_string(v) + " is not allowed. Allowed values: " + allowed);
}

void field_spec::type_mismatch(const value_t& v, const char* allowed) const {
    throw validation_error(to_display_string(v) + " has type: " + type_name(v) +
                           ". Allowed only: " + allowed);
}

void field_spec::bad_raw(const nlohmann::json& raw) const {
    throw validation_error(raw.dump() + " can not be deserialized as " + to_string(kind_));
}

// ============================================================================
// string_field
// ============================================================================

nlohmann::json string_field::serialize(const value_t& v) const {
    if (std::holds_alternative<instance_ptr>(v) || std::holds_alternative<instance_list>(v)) {
        type_mismatch(v, "string");
    }
    return to_display_string(v);
}

value_t string_field::normalize(const value_t& v) const {
    return to_display_string(v);
}

value_t string_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_string()) return raw.get<std::string>();
    if (raw.is_number() || raw.is_boolean()) return raw.dump();
    bad_raw(raw);
}

// ============================================================================
// number_field / id_field
// ============================================================================

nlohmann::json number_field::serialize(const value_t& v) const {
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    if (auto* d = std::get_if<double>(&v)) return finite(*d);
    type_mismatch(v, "int, float");
}

value_t number_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_number_integer()) return raw.get<int64_t>();
    if (raw.is_number_float()) return raw.get<double>();
    if (raw.is_string()) {
        const auto text = raw.get<std::string>();
        size_t consumed = 0;
        try {
            if (text.find('.') != std::string::npos) {
                double d = std::stod(text, &consumed);
                if (consumed == text.size()) return d;
            } else {
                int64_t i = std::stoll(text, &consumed);
                if (consumed == text.size()) return i;
            }
        } catch (const std::logic_error&) {
            // falls through to bad_raw
        }
    }
    bad_raw(raw);
}

id_field::id_field()
    : field_base(field_kind::id, field_options{.nullable = false}) {}

nlohmann::json id_field::serialize(const value_t& v) const {
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    type_mismatch(v, "int");
}

value_t id_field::parse(const nlohmann::json& raw, const deserialize_context& ctx) const {
    value_t v = number_field::parse(raw, ctx);
    if (!std::holds_alternative<int64_t>(v)) {
        bad_raw(raw);
    }
    return v;
}

// ============================================================================
// bool_field
// ============================================================================

namespace {

field_options with_bool_choices(field_options options) {
    options.choices = choice_map{{true, "Yes"}, {false, "No"}};
    return options;
}

} // namespace

bool_field::bool_field(field_options options)
    : field_base(field_kind::boolean, with_bool_choices(std::move(options))) {}

nlohmann::json bool_field::serialize(const value_t& v) const {
    if (auto* b = std::get_if<bool>(&v)) return *b ? 1 : 0;
    type_mismatch(v, "bool");
}

value_t bool_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_boolean()) return raw.get<bool>();
    if (raw.is_number_integer()) return raw.get<int64_t>() != 0;
    bad_raw(raw);
}

// ============================================================================
// decimal_field
// ============================================================================

nlohmann::json decimal_field::serialize(const value_t& v) const {
    if (auto* d = std::get_if<decimal_t>(&v)) return finite(d->to_double());
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    if (auto* f = std::get_if<double>(&v)) return finite(*f);
    type_mismatch(v, "int, float, decimal");
}

value_t decimal_field::normalize(const value_t& v) const {
    if (auto* i = std::get_if<int64_t>(&v)) return decimal_t(*i);
    if (auto* f = std::get_if<double>(&v)) return decimal_t(*f);
    // Precision beyond a double is not kept in the record
    return decimal_t(std::get<decimal_t>(v).to_double());
}

value_t decimal_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_number_integer()) return decimal_t(raw.get<int64_t>());
    if (raw.is_number_float()) return decimal_t(raw.get<double>());
    if (raw.is_string()) return decimal_t(raw.get<std::string>());
    bad_raw(raw);
}

// ============================================================================
// json_field
// ============================================================================

bool json_field::is_allowed(const nlohmann::json& doc) const {
    if (doc.is_object()) return (allowed_types_ & object) != 0;
    if (doc.is_array()) return (allowed_types_ & array) != 0;
    return false;
}

std::string json_field::allowed_text() const {
    std::string text;
    if (allowed_types_ & object) text = "dict";
    if (allowed_types_ & array) text += text.empty() ? "list" : ", list";
    return text;
}

nlohmann::json json_field::serialize(const value_t& v) const {
    auto* j = std::get_if<json_value>(&v);
    if (j == nullptr || !is_allowed(j->doc)) {
        type_mismatch(v, allowed_text().c_str());
    }
    return j->doc.dump();
}

nlohmann::json json_field::decode(const nlohmann::json& raw) const {
    if (!raw.is_string()) {
        bad_raw(raw);
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(raw.get<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        throw validation_error(std::string("malformed JSON in ") + to_string(kind()) + " field: " + e.what());
    }
    if (!is_allowed(doc)) {
        throw validation_error(doc.dump() + " has type: " + doc.type_name() +
                               ". Allowed only: " + allowed_text());
    }
    return doc;
}

value_t json_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    return json_value(decode(raw));
}

// ============================================================================
// datetime_field / date_field
// ============================================================================

nlohmann::json datetime_field::serialize(const value_t& v) const {
    if (auto* ts = std::get_if<timestamp_t>(&v)) return format_datetime(*ts);
    type_mismatch(v, "datetime");
}

value_t datetime_field::normalize(const value_t& v) const {
    return timestamp_t(std::chrono::floor<std::chrono::seconds>(std::get<timestamp_t>(v)));
}

value_t datetime_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_string()) {
        if (auto ts = parse_datetime(raw.get<std::string>())) return *ts;
    }
    bad_raw(raw);
}

nlohmann::json date_field::serialize(const value_t& v) const {
    if (auto* d = std::get_if<date_t>(&v)) {
        if (!d->is_valid()) {
            throw validation_error(format_date(*d) + " is not a valid date");
        }
        return format_date(*d);
    }
    if (auto* ts = std::get_if<timestamp_t>(&v)) return format_date(date_t::from_timestamp(*ts));
    type_mismatch(v, "date, datetime");
}

value_t date_field::normalize(const value_t& v) const {
    if (auto* ts = std::get_if<timestamp_t>(&v)) return date_t::from_timestamp(*ts);
    return v;
}

value_t date_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    if (raw.is_string()) {
        if (auto d = parse_date(raw.get<std::string>())) return *d;
    }
    bad_raw(raw);
}

// ============================================================================
// Reference fields
// ============================================================================

namespace {

model_id_t reference_id_of(const instance_ptr& instance, const std::string& target_model) {
    if (!instance) {
        throw validation_error("reference to a null " + target_model + " instance");
    }
    if (instance->model_name() != target_model) {
        throw validation_error(instance->model_name() + " instance can not be referenced as " + target_model);
    }
    auto id = instance->id();
    if (!id) {
        throw validation_error("referenced " + target_model + " instance is not saved");
    }
    return *id;
}

relation_resolver& require_resolver(const deserialize_context& ctx, const std::string& target_model) {
    if (ctx.resolver == nullptr) {
        throw relation_error("no resolver available for references to " + target_model);
    }
    return *ctx.resolver;
}

} // namespace

const std::string* reference_target(const field_spec& field) {
    if (auto* ref = dynamic_cast<const reference_field*>(&field)) return &ref->target_model();
    if (auto* multi = dynamic_cast<const multi_reference_field*>(&field)) return &multi->target_model();
    return nullptr;
}

std::vector<model_id_t> ids_from_value(const value_t& v) {
    std::vector<model_id_t> ids;
    if (auto* p = std::get_if<instance_ptr>(&v)) {
        if (*p) ids.push_back(reference_id_of(*p, (*p)->model_name()));
    } else if (auto* list = std::get_if<instance_list>(&v)) {
        for (const auto& item : *list) {
            if (item) ids.push_back(reference_id_of(item, item->model_name()));
        }
    } else if (auto* i = std::get_if<int64_t>(&v)) {
        ids.push_back(*i);
    } else if (auto* j = std::get_if<json_value>(&v); j && j->doc.is_array()) {
        for (const auto& item : j->doc) {
            if (!item.is_number_integer()) {
                throw validation_error(item.dump() + " is not an id");
            }
            ids.push_back(item.get<model_id_t>());
        }
    } else {
        throw validation_error(std::string("can't get ids from ") + type_name(v));
    }
    return ids;
}

reference_field::reference_field(std::string target_model, field_options options)
    : field_base(field_kind::reference, std::move(options)), target_model_(std::move(target_model)) {}

nlohmann::json reference_field::serialize(const value_t& v) const {
    if (auto* p = std::get_if<instance_ptr>(&v)) return reference_id_of(*p, target_model_);
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    type_mismatch(v, target_model_.c_str());
}

value_t reference_field::parse(const nlohmann::json& raw, const deserialize_context& ctx) const {
    if (!raw.is_number_integer()) {
        bad_raw(raw);
    }
    auto id = raw.get<model_id_t>();
    auto found = require_resolver(ctx, target_model_).resolve(target_model_, {id}, ctx.depth + 1);
    if (found.size() != 1) {
        throw relation_error("found " + std::to_string(found.size()) + " " + target_model_ +
                             " records with id " + std::to_string(id) + ", expected exactly one");
    }
    return found.front();
}

multi_reference_field::multi_reference_field(std::string target_model, field_options options)
    : field_base(field_kind::multi_reference, std::move(options)), target_model_(std::move(target_model)) {}

nlohmann::json multi_reference_field::serialize(const value_t& v) const {
    nlohmann::json ids = nlohmann::json::array();
    if (auto* list = std::get_if<instance_list>(&v)) {
        for (const auto& item : *list) {
            ids.push_back(reference_id_of(item, target_model_));
        }
    } else if (std::holds_alternative<json_value>(v)) {
        for (auto id : ids_from_value(v)) ids.push_back(id);
    } else {
        type_mismatch(v, (target_model_ + " list").c_str());
    }
    return ids.dump();
}

value_t multi_reference_field::parse(const nlohmann::json& raw, const deserialize_context& ctx) const {
    auto doc = decode(raw);
    std::vector<model_id_t> ids;
    ids.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_number_integer()) {
            bad_raw(raw);
        }
        ids.push_back(item.get<model_id_t>());
    }
    if (ids.empty()) {
        return instance_list{};
    }
    return require_resolver(ctx, target_model_).resolve(target_model_, ids, ctx.depth + 1);
}

// ============================================================================
// raw_field
// ============================================================================

nlohmann::json raw_field::serialize(const value_t& v) const {
    return value_to_json(v);
}

value_t raw_field::parse(const nlohmann::json& raw, const deserialize_context&) const {
    return value_from_json(raw);
}

} // namespace keystone
