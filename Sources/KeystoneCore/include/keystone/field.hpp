#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keystone {

// ============================================================================
// Field kinds and options
// ============================================================================

enum class field_kind {
    string,
    number,
    id,
    boolean,
    decimal,
    json,
    dict,
    list,
    datetime,
    date,
    reference,
    multi_reference,
    raw             // opaque value of an unregistered model
};

const char* to_string(field_kind kind);

// Zero-argument default generator, invoked once per clean()
using default_generator = std::function<value_t()>;

// Allowed value -> display label
using choice_map = std::vector<std::pair<value_t, std::string>>;

struct field_options {
    value_t default_value;              // static default
    default_generator generator;        // wins over default_value when set
    std::optional<choice_map> choices;
    bool nullable = true;
};

// ============================================================================
// Relation resolution
// ============================================================================

// Resolves stored ids back into instances of a registered model.
class relation_resolver {
public:
    virtual ~relation_resolver() = default;

    // Instances of model_name whose id is in ids; order is not guaranteed.
    // depth is the nesting level of the reference being resolved.
    virtual instance_list resolve(const std::string& model_name,
                                  const std::vector<model_id_t>& ids,
                                  int depth) = 0;
};

struct deserialize_context {
    bool lenient = true;                    // log and null out bad values instead of throwing
    relation_resolver* resolver = nullptr;  // required by reference fields
    int depth = 0;
};

// ============================================================================
// field_spec - typed contract for one attribute
// ============================================================================
//
// A field owns its current value. Schemas hold prototypes; every instance
// clones them, so values are never shared between instances.

class field_spec {
public:
    field_spec(field_kind kind, field_options options);
    virtual ~field_spec() = default;

    field_kind kind() const { return kind_; }
    bool nullable() const { return options_.nullable; }
    const std::optional<choice_map>& choices() const { return options_.choices; }
    bool has_default() const;

    const value_t& value() const { return value_; }
    void set_value(value_t v) { value_ = std::move(v); }

    // Default value, invoking the generator if there is one
    value_t resolve_default() const;

    /// Resolves the default if the value is null, validates it and returns the
    /// serialized form. The resolved value stays in the field.
    /// Throws validation_error.
    nlohmann::json clean();

    /// Reconstructs a typed value from its serialized form.
    /// Null on a non-nullable field throws in strict mode, logs in lenient mode.
    value_t deserialize(const nlohmann::json& raw, const deserialize_context& ctx) const;

    virtual std::unique_ptr<field_spec> clone() const = 0;

protected:
    // v is never null
    virtual nlohmann::json serialize(const value_t& v) const = 0;
    // raw is never null
    virtual value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const = 0;

    // Value stored back into the field after clean(); defaults to v
    virtual value_t normalize(const value_t& v) const { return v; }

    [[noreturn]] void type_mismatch(const value_t& v, const char* allowed) const;
    [[noreturn]] void bad_raw(const nlohmann::json& raw) const;

    field_options options_;

private:
    void check_choices(const value_t& v) const;

    field_kind kind_;
    value_t value_;
};

// Supplies clone() for concrete fields
template<typename Derived, typename Base = field_spec>
class field_base : public Base {
public:
    using Base::Base;

    std::unique_ptr<field_spec> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

// ============================================================================
// Concrete fields
// ============================================================================

class string_field : public field_base<string_field> {
public:
    explicit string_field(field_options options = {})
        : field_base(field_kind::string, std::move(options)) {}

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
    value_t normalize(const value_t& v) const override;
};

class number_field : public field_base<number_field> {
public:
    explicit number_field(field_options options = {})
        : field_base(field_kind::number, std::move(options)) {}

protected:
    number_field(field_kind kind, field_options options)
        : field_base(kind, std::move(options)) {}

    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
};

// Record identifier: integral, never null
class id_field : public field_base<id_field, number_field> {
public:
    id_field();

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
};

// Stored as 0/1; choices fixed to {true: "Yes", false: "No"}
class bool_field : public field_base<bool_field> {
public:
    explicit bool_field(field_options options = {});

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
};

class decimal_field : public field_base<decimal_field> {
public:
    explicit decimal_field(field_options options = {})
        : field_base(field_kind::decimal, std::move(options)) {}

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
    value_t normalize(const value_t& v) const override;
};

// JSON document stored as an encoded string; the decoded document must be
// one of the allowed JSON types.
class json_field : public field_base<json_field> {
public:
    enum allowed : unsigned {
        object = 1u << 0,
        array = 1u << 1,
        any_container = object | array
    };

    explicit json_field(field_options options = {}, unsigned allowed_types = any_container)
        : field_base(field_kind::json, std::move(options)), allowed_types_(allowed_types) {}

    unsigned allowed_types() const { return allowed_types_; }

protected:
    json_field(field_kind kind, field_options options, unsigned allowed_types)
        : field_base(kind, std::move(options)), allowed_types_(allowed_types) {}

    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;

    bool is_allowed(const nlohmann::json& doc) const;
    std::string allowed_text() const;
    nlohmann::json decode(const nlohmann::json& raw) const;

private:
    unsigned allowed_types_;
};

class dict_field : public field_base<dict_field, json_field> {
public:
    explicit dict_field(field_options options = {})
        : field_base(field_kind::dict, std::move(options), json_field::object) {}
};

class list_field : public field_base<list_field, json_field> {
public:
    explicit list_field(field_options options = {})
        : field_base(field_kind::list, std::move(options), json_field::array) {}

protected:
    list_field(field_kind kind, field_options options)
        : field_base(kind, std::move(options), json_field::array) {}
};

class datetime_field : public field_base<datetime_field> {
public:
    explicit datetime_field(field_options options = {})
        : field_base(field_kind::datetime, std::move(options)) {}

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
    value_t normalize(const value_t& v) const override;
};

class date_field : public field_base<date_field> {
public:
    explicit date_field(field_options options = {})
        : field_base(field_kind::date, std::move(options)) {}

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
    value_t normalize(const value_t& v) const override;
};

// Single reference: stores the id of a target_model instance
class reference_field : public field_base<reference_field> {
public:
    explicit reference_field(std::string target_model, field_options options = {});

    const std::string& target_model() const { return target_model_; }

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;

private:
    std::string target_model_;
};

// Multi reference: stores a JSON-encoded list of target_model ids
class multi_reference_field : public field_base<multi_reference_field, list_field> {
public:
    explicit multi_reference_field(std::string target_model, field_options options = {});

    const std::string& target_model() const { return target_model_; }

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;

private:
    std::string target_model_;
};

// Untyped passthrough used for records of unregistered models
class raw_field : public field_base<raw_field> {
public:
    raw_field() : field_base(field_kind::raw, field_options{}) {}

protected:
    nlohmann::json serialize(const value_t& v) const override;
    value_t parse(const nlohmann::json& raw, const deserialize_context& ctx) const override;
};

// Target model of a reference or multi reference field, nullptr otherwise
const std::string* reference_target(const field_spec& field);

// Ids held by a reference value (instance, instance list, bare id).
// Throws validation_error for unsaved instances.
std::vector<model_id_t> ids_from_value(const value_t& v);

} // namespace keystone

#endif // __cplusplus
