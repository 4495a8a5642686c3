#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "field.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keystone {

class model_schema;

// ============================================================================
// model_instance - a live object with one field copy per schema entry
// ============================================================================
//
// The field list is the only source of truth for values: get() and set()
// read and write it directly. Not thread-safe; share instances across threads
// only read-only.
//
// References loaded by a query are stored without ownership; the instances
// of one query are owned by its instance_graph. get() hands references out
// with shared ownership of that graph, so cyclic records never form a
// shared_ptr cycle. Values read through fields() carry the raw edges and are
// only valid while this instance is.

class instance_graph;

class model_instance : public std::enable_shared_from_this<model_instance> {
public:
    explicit model_instance(std::shared_ptr<const model_schema> schema);

    model_instance(const model_instance& other);
    model_instance& operator=(const model_instance& other);
    model_instance(model_instance&&) noexcept = default;
    model_instance& operator=(model_instance&&) noexcept = default;

    const std::string& model_name() const;
    const model_schema& schema() const { return *schema_; }
    const std::shared_ptr<const model_schema>& schema_ptr() const { return schema_; }

    /// Id assigned on the first successful save
    std::optional<model_id_t> id() const;
    bool is_saved() const { return id().has_value(); }

    bool contains(const std::string& field_name) const;

    /// Current value; throws validation_error for unknown fields
    value_t get(const std::string& field_name) const;

    /// Typed access; throws validation_error when the value has another type
    template<typename T>
    T get_as(const std::string& field_name) const {
        value_t v = get(field_name);
        if (auto* typed = std::get_if<T>(&v)) {
            return std::move(*typed);
        }
        throw validation_error(model_name() + "." + field_name + " holds a " + type_name(v));
    }

    /// Writes through to the field. Unknown fields and id changes throw
    /// validation_error. A reference to this instance itself is kept
    /// without ownership.
    void set(const std::string& field_name, value_t value);

    /// Assigns several fields; fails before writing anything if one is unknown
    void assign(const value_map& values);

    field_spec& field(const std::string& field_name);
    const field_spec& field(const std::string& field_name) const;

    const std::vector<std::pair<std::string, std::unique_ptr<field_spec>>>& fields() const {
        return fields_;
    }

    /// Same model and equal values for every field
    bool operator==(const model_instance& other) const;
    bool operator!=(const model_instance& other) const { return !(*this == other); }

private:
    friend class keystone_db;
    friend class query_engine;

    void assign_id(model_id_t id);
    void write(const std::string& field_name, value_t value);
    void share_references(value_t& value) const;
    std::unique_ptr<field_spec>* find(const std::string& field_name);
    const std::unique_ptr<field_spec>* find(const std::string& field_name) const;

    std::shared_ptr<const model_schema> schema_;
    std::vector<std::pair<std::string, std::unique_ptr<field_spec>>> fields_;

    // Query results own their graph; graph members only observe it
    std::shared_ptr<instance_graph> graph_;
    std::weak_ptr<instance_graph> member_of_;
};

// ============================================================================
// instance_graph - owner of the referenced instances loaded by one query
// ============================================================================

class instance_graph {
public:
    void adopt(instance_ptr member) { members_.push_back(std::move(member)); }
    size_t size() const { return members_.size(); }

private:
    instance_list members_;
};

} // namespace keystone

#endif // __cplusplus
