#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "field.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace keystone {

struct field_entry {
    std::string name;
    std::shared_ptr<const field_spec> prototype;
};

// ============================================================================
// model_schema - ordered field name -> field prototype mapping
// ============================================================================
//
// Usage:
//   keystone::model_schema session("Session");
//   session.add("token", keystone::string_field({.generator = make_token}))
//          .add("created", keystone::datetime_field({.generator = keystone::now_utc}));
//   db.register_model(std::move(session));
//
// Every schema starts with an "id" field. Fields keep declaration order.

class model_schema {
public:
    explicit model_schema(std::string name);

    /// Derived schema: starts with all fields of base, in base order
    model_schema(std::string name, const model_schema& base);

    /// Adds a field prototype (cloned). Duplicate names throw validation_error.
    model_schema& add(const std::string& field_name, const field_spec& spec);

    const std::string& name() const { return name_; }
    const std::vector<field_entry>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }

    const field_spec* find(const std::string& field_name) const;
    bool has_field(const std::string& field_name) const { return find(field_name) != nullptr; }
    std::vector<std::string> field_names() const;

    /// Schema of an unregistered model: every record key becomes a raw field
    static model_schema opaque(const std::string& name, const nlohmann::json& record);

private:
    std::string name_;
    std::vector<field_entry> fields_;
};

// ============================================================================
// schema_registry - explicit model name -> schema mapping owned by a context
// ============================================================================

class schema_registry {
public:
    schema_registry() = default;

    schema_registry(const schema_registry&) = delete;
    schema_registry& operator=(const schema_registry&) = delete;

    /// Registers a schema. Throws validation_error for duplicate or invalid
    /// names and for references to models that are not registered yet.
    std::shared_ptr<const model_schema> register_model(model_schema schema);

    std::shared_ptr<const model_schema> get_schema(const std::string& model_name) const;

    /// Like get_schema, but throws validation_error when not registered
    std::shared_ptr<const model_schema> require(const std::string& model_name) const;

    bool contains(const std::string& model_name) const;

    /// Registered schemas in registration order
    std::vector<std::shared_ptr<const model_schema>> all_schemas() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const model_schema>> schemas_by_name_;
    std::vector<std::string> order_;
};

} // namespace keystone

#endif // __cplusplus
