#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "field.hpp"
#include "model.hpp"
#include "schema.hpp"
#include "store.hpp"
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keystone {

// ============================================================================
// Predicates
// ============================================================================

enum class filter_op {
    exact,
    iexact,
    contains,
    in,
    gt,
    gte,
    lt,
    lte,
    startswith,
    endswith,
    istartswith,
    iendswith,
    range,
    isnull
};

std::optional<filter_op> filter_op_from_string(const std::string& name);
const char* to_string(filter_op op);

/// One condition: the value at path (field names joined by "__" through
/// reference fields) compared to operand with op.
///
/// Operand shapes:
///   in       json_value array or instance_list
///   range    json_value [low, high] (inclusive) or an int n (0 <= x < n)
///   isnull   bool
///   contains substring, array element, object key or referenced instance
struct predicate {
    std::vector<std::string> path;
    filter_op op = filter_op::exact;
    value_t operand;

    /// Parses "<field>[__<field>...][__<operator>]". Throws validation_error
    /// for empty segments.
    static predicate parse(const std::string& expression, value_t operand);

    std::string path_string() const;
};

/// Conjunction of predicates
class filter {
public:
    filter() = default;
    filter(std::initializer_list<std::pair<std::string, value_t>> terms);

    filter& where(const std::string& expression, value_t operand);
    filter& where(predicate p);

    const std::vector<predicate>& predicates() const { return predicates_; }
    bool empty() const { return predicates_.empty(); }

private:
    std::vector<predicate> predicates_;
};

// ============================================================================
// query_set - materialized query result
// ============================================================================
//
// Records come back in store enumeration order; use order_by for a defined
// order.

class query_set {
public:
    using const_iterator = instance_list::const_iterator;

    query_set(std::shared_ptr<const model_schema> schema, instance_list items);

    const model_schema& schema() const { return *schema_; }

    size_t count() const { return items_.size(); }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    /// "field" ascending (nulls first), "-field" descending.
    /// Throws validation_error for unknown fields.
    query_set order_by(const std::string& field_name) const;

    /// Field name -> value per instance; all fields when names is empty.
    /// Throws validation_error for unknown fields.
    std::vector<value_map> values(const std::vector<std::string>& names = {}) const;

    std::map<model_id_t, instance_ptr> as_map() const;
    const instance_list& as_list() const { return items_; }

    /// Throw std::out_of_range when empty
    const instance_ptr& first() const;
    const instance_ptr& last() const;

    const instance_ptr& operator[](size_t index) const { return items_.at(index); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

private:
    std::shared_ptr<const model_schema> schema_;
    instance_list items_;
};

// ============================================================================
// query_engine - scan, deserialize and filter records in memory
// ============================================================================

struct query_options {
    std::string prefix;
    bool lenient = true;            // see configuration::ignore_deserialization_errors
    bool use_keys = true;           // keys() listing, or streaming scan()
    int max_relation_depth = 16;
};

class query_engine : public relation_resolver {
public:
    query_engine(kv_store& store, const schema_registry& registry, query_options options);

    /// Instances of model_name matching every predicate of f.
    /// Predicates are validated before any record is read. Each record is
    /// loaded once per call, so reference cycles resolve to shared instances.
    query_set execute(const std::string& model_name, const filter& f = {}, int depth = 0);

    /// Loads the given ids of a registered model; missing records are skipped
    instance_list resolve(const std::string& model_name,
                          const std::vector<model_id_t>& ids,
                          int depth) override;

    /// Stored record of one instance, if present
    std::optional<nlohmann::json> load_record(const std::string& model_name, model_id_t id);

    std::vector<std::string> record_keys(const std::string& model_name);
    std::string record_key(const std::string& model_name, model_id_t id) const;
    std::string record_pattern(const std::string& model_name) const;

    const query_options& options() const { return options_; }

private:
    class load_scope;

    void validate(const model_schema* schema, const filter& f) const;

    // Schema of a referenced model; throws relation_error past the depth limit
    std::shared_ptr<const model_schema> relation_schema(const std::string& model_name, int depth) const;

    // members: the records are reference targets and join the scope's graph
    instance_list load(const std::string& model_name,
                       const std::shared_ptr<const model_schema>& schema,
                       const std::vector<std::string>& keys,
                       const filter& f,
                       int depth,
                       load_scope& scope,
                       bool members);

    std::optional<model_id_t> id_from_key(const std::string& model_name, const std::string& key) const;

    // Applies the lenient/strict policy; returns only in lenient mode
    void reject(const std::string& message) const;

    kv_store& store_;
    const schema_registry& registry_;
    query_options options_;
};

/// True when value satisfies p.op against p.operand (p.path is ignored).
/// Exposed for tests.
bool matches(const predicate& p, const value_t& value);

} // namespace keystone

#endif // __cplusplus
