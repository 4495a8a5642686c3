#include "keystone/query.hpp"
#include "keystone/log.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <map>
#include <set>

namespace keystone {

namespace {

constexpr const char* k_separator = "__";

const std::pair<const char*, filter_op> k_operators[] = {
    {"exact", filter_op::exact},
    {"iexact", filter_op::iexact},
    {"contains", filter_op::contains},
    {"in", filter_op::in},
    {"gt", filter_op::gt},
    {"gte", filter_op::gte},
    {"lt", filter_op::lt},
    {"lte", filter_op::lte},
    {"startswith", filter_op::startswith},
    {"endswith", filter_op::endswith},
    {"istartswith", filter_op::istartswith},
    {"iendswith", filter_op::iendswith},
    {"range", filter_op::range},
    {"isnull", filter_op::isnull},
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Text form used by the string operators; nullopt for values without one
std::optional<std::string> text_of(const value_t& v) {
    if (is_null(v) || std::holds_alternative<instance_ptr>(v) || std::holds_alternative<instance_list>(v)) {
        return std::nullopt;
    }
    return to_display_string(v);
}

timestamp_t start_of_day(const date_t& d) {
    std::tm tm{};
    tm.tm_year = d.year - 1900;
    tm.tm_mon = static_cast<int>(d.month) - 1;
    tm.tm_mday = static_cast<int>(d.day);
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// Brings a date/time operand onto the value's type so both sides compare in UTC
value_t coerce_operand(const value_t& v, const value_t& operand) {
    if (std::holds_alternative<date_t>(v)) {
        if (auto* ts = std::get_if<timestamp_t>(&operand)) return date_t::from_timestamp(*ts);
        if (auto* s = std::get_if<std::string>(&operand)) {
            if (auto d = parse_date(*s)) return *d;
        }
    } else if (std::holds_alternative<timestamp_t>(v)) {
        if (auto* d = std::get_if<date_t>(&operand)) return start_of_day(*d);
        if (auto* s = std::get_if<std::string>(&operand)) {
            if (auto ts = parse_datetime(*s)) return *ts;
        }
    }
    return operand;
}

std::optional<int> compare_coerced(const value_t& v, const value_t& operand) {
    return compare_values(v, coerce_operand(v, operand));
}

bool equal_coerced(const value_t& v, const value_t& operand) {
    auto c = compare_coerced(v, operand);
    return c.has_value() && *c == 0;
}

// Candidate values of an "in" operand
std::vector<value_t> operand_items(const value_t& operand) {
    std::vector<value_t> items;
    if (auto* j = std::get_if<json_value>(&operand)) {
        for (const auto& item : j->doc) {
            items.push_back(value_from_json(item));
        }
    } else if (auto* list = std::get_if<instance_list>(&operand)) {
        for (const auto& item : *list) {
            items.emplace_back(item);
        }
    }
    return items;
}

bool contains_value(const value_t& v, const value_t& operand) {
    if (auto* s = std::get_if<std::string>(&v)) {
        auto needle = text_of(operand);
        return needle && s->find(*needle) != std::string::npos;
    }
    if (auto* j = std::get_if<json_value>(&v)) {
        if (j->doc.is_object()) {
            auto* key = std::get_if<std::string>(&operand);
            return key && j->doc.contains(*key);
        }
        if (j->doc.is_array()) {
            for (const auto& item : j->doc) {
                if (values_equal(value_from_json(item), operand)) return true;
            }
        }
        return false;
    }
    if (auto* list = std::get_if<instance_list>(&v)) {
        for (const auto& item : *list) {
            if (values_equal(value_t(item), operand)) return true;
        }
        return false;
    }
    return false;
}

bool in_range(const value_t& v, const value_t& operand) {
    if (auto* j = std::get_if<json_value>(&operand)) {
        auto lo = compare_coerced(v, value_from_json(j->doc.at(0)));
        auto hi = compare_coerced(v, value_from_json(j->doc.at(1)));
        return lo && hi && *lo >= 0 && *hi <= 0;
    }
    auto* x = std::get_if<int64_t>(&v);
    auto* n = std::get_if<int64_t>(&operand);
    return x && n && *x >= 0 && *x < *n;
}

void check_operand(const predicate& p, const std::string& where) {
    switch (p.op) {
        case filter_op::in:
            if (auto* j = std::get_if<json_value>(&p.operand); j && j->doc.is_array()) return;
            if (std::holds_alternative<instance_list>(p.operand)) return;
            throw validation_error(where + "__in expects a list operand");
        case filter_op::range:
            if (auto* j = std::get_if<json_value>(&p.operand); j && j->doc.is_array() && j->doc.size() == 2) return;
            if (std::holds_alternative<int64_t>(p.operand)) return;
            throw validation_error(where + "__range expects [low, high] or an integer bound");
        case filter_op::isnull:
            if (std::holds_alternative<bool>(p.operand)) return;
            throw validation_error(where + "__isnull expects a bool operand");
        default:
            return;
    }
}

} // namespace

// ============================================================================
// Predicates
// ============================================================================

std::optional<filter_op> filter_op_from_string(const std::string& name) {
    for (const auto& [text, op] : k_operators) {
        if (name == text) return op;
    }
    return std::nullopt;
}

const char* to_string(filter_op op) {
    for (const auto& [text, candidate] : k_operators) {
        if (candidate == op) return text;
    }
    return "unknown";
}

predicate predicate::parse(const std::string& expression, value_t operand) {
    predicate p;
    p.operand = std::move(operand);

    size_t start = 0;
    while (true) {
        size_t pos = expression.find(k_separator, start);
        std::string segment = expression.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (segment.empty()) {
            throw validation_error("malformed filter expression '" + expression + "'");
        }
        p.path.push_back(std::move(segment));
        if (pos == std::string::npos) break;
        start = pos + 2;
    }

    if (p.path.size() > 1) {
        if (auto op = filter_op_from_string(p.path.back())) {
            p.op = *op;
            p.path.pop_back();
        }
    }
    return p;
}

std::string predicate::path_string() const {
    std::string out;
    for (const auto& segment : path) {
        if (!out.empty()) out += k_separator;
        out += segment;
    }
    return out;
}

bool matches(const predicate& p, const value_t& value) {
    switch (p.op) {
        case filter_op::exact:
            if (is_null(value) || is_null(p.operand)) return is_null(value) && is_null(p.operand);
            return equal_coerced(value, p.operand);
        case filter_op::iexact: {
            if (is_null(value) || is_null(p.operand)) return is_null(value) && is_null(p.operand);
            auto a = text_of(value);
            auto b = text_of(p.operand);
            return a && b && lower(*a) == lower(*b);
        }
        case filter_op::contains:
            return contains_value(value, p.operand);
        case filter_op::in:
            for (const auto& item : operand_items(p.operand)) {
                if (equal_coerced(value, item)) return true;
            }
            return false;
        case filter_op::gt: {
            auto c = compare_coerced(value, p.operand);
            return c && *c > 0;
        }
        case filter_op::gte: {
            auto c = compare_coerced(value, p.operand);
            return c && *c >= 0;
        }
        case filter_op::lt: {
            auto c = compare_coerced(value, p.operand);
            return c && *c < 0;
        }
        case filter_op::lte: {
            auto c = compare_coerced(value, p.operand);
            return c && *c <= 0;
        }
        case filter_op::startswith:
        case filter_op::endswith:
        case filter_op::istartswith:
        case filter_op::iendswith: {
            auto text = text_of(value);
            auto affix = text_of(p.operand);
            if (!text || !affix) return false;
            bool fold = p.op == filter_op::istartswith || p.op == filter_op::iendswith;
            if (fold) {
                text = lower(*text);
                affix = lower(*affix);
            }
            bool prefix = p.op == filter_op::startswith || p.op == filter_op::istartswith;
            return prefix ? starts_with(*text, *affix) : ends_with(*text, *affix);
        }
        case filter_op::range:
            return !is_null(value) && in_range(value, p.operand);
        case filter_op::isnull: {
            auto* expected = std::get_if<bool>(&p.operand);
            return expected && is_null(value) == *expected;
        }
    }
    return false;
}

filter::filter(std::initializer_list<std::pair<std::string, value_t>> terms) {
    for (const auto& [expression, operand] : terms) {
        where(expression, operand);
    }
}

filter& filter::where(const std::string& expression, value_t operand) {
    predicates_.push_back(predicate::parse(expression, std::move(operand)));
    return *this;
}

filter& filter::where(predicate p) {
    if (p.path.empty()) {
        throw validation_error("predicate without a field");
    }
    predicates_.push_back(std::move(p));
    return *this;
}

// ============================================================================
// query_set
// ============================================================================

query_set::query_set(std::shared_ptr<const model_schema> schema, instance_list items)
    : schema_(std::move(schema)), items_(std::move(items)) {}

query_set query_set::order_by(const std::string& field_name) const {
    bool descending = !field_name.empty() && field_name.front() == '-';
    std::string name = descending ? field_name.substr(1) : field_name;
    if (!schema_->has_field(name)) {
        throw validation_error(schema_->name() + " has no field " + name + " to order by");
    }

    instance_list sorted = items_;
    std::stable_sort(sorted.begin(), sorted.end(), [&](const instance_ptr& a, const instance_ptr& b) {
        const value_t& va = a->get(name);
        const value_t& vb = b->get(name);
        if (is_null(va) || is_null(vb)) {
            return is_null(va) && !is_null(vb);
        }
        auto c = compare_values(va, vb);
        if (c) return *c < 0;
        return va.index() < vb.index();
    });
    if (descending) {
        std::reverse(sorted.begin(), sorted.end());
    }
    return query_set(schema_, std::move(sorted));
}

std::vector<value_map> query_set::values(const std::vector<std::string>& names) const {
    std::vector<std::string> selected = names.empty() ? schema_->field_names() : names;
    for (const auto& name : selected) {
        if (!schema_->has_field(name)) {
            throw validation_error(schema_->name() + " has no field " + name);
        }
    }

    std::vector<value_map> rows;
    rows.reserve(items_.size());
    for (const auto& item : items_) {
        value_map row;
        for (const auto& name : selected) {
            row[name] = item->get(name);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::map<model_id_t, instance_ptr> query_set::as_map() const {
    std::map<model_id_t, instance_ptr> by_id;
    for (const auto& item : items_) {
        if (auto id = item->id()) {
            by_id[*id] = item;
        }
    }
    return by_id;
}

const instance_ptr& query_set::first() const {
    if (items_.empty()) {
        throw std::out_of_range("query_set::first on an empty result");
    }
    return items_.front();
}

const instance_ptr& query_set::last() const {
    if (items_.empty()) {
        throw std::out_of_range("query_set::last on an empty result");
    }
    return items_.back();
}

// ============================================================================
// query_engine
// ============================================================================

query_engine::query_engine(kv_store& store, const schema_registry& registry, query_options options)
    : store_(store), registry_(registry), options_(std::move(options)) {}

std::string query_engine::record_key(const std::string& model_name, model_id_t id) const {
    return options_.prefix + ":" + model_name + ":" + std::to_string(id);
}

std::string query_engine::record_pattern(const std::string& model_name) const {
    return options_.prefix + ":" + model_name + ":*";
}

std::vector<std::string> query_engine::record_keys(const std::string& model_name) {
    if (options_.use_keys) {
        return store_.keys(record_pattern(model_name));
    }
    std::vector<std::string> keys;
    store_.scan(record_pattern(model_name), [&](const std::string& key) { keys.push_back(key); });
    return keys;
}

std::optional<model_id_t> query_engine::id_from_key(const std::string& model_name,
                                                    const std::string& key) const {
    std::string head = options_.prefix + ":" + model_name + ":";
    if (!starts_with(key, head) || key.size() == head.size()) {
        return std::nullopt;
    }
    model_id_t id = 0;
    const char* first = key.data() + head.size();
    const char* last = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(first, last, id);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return id;
}

void query_engine::reject(const std::string& message) const {
    if (!options_.lenient) {
        throw validation_error(message);
    }
    LOG_WARN("query", "%s, skipping", message.c_str());
}

void query_engine::validate(const model_schema* schema, const filter& f) const {
    for (const auto& p : f.predicates()) {
        if (p.path.empty()) {
            throw validation_error("predicate without a field");
        }
        check_operand(p, p.path_string());

        if (schema == nullptr) {
            // Opaque records can't be traversed
            if (p.path.size() > 1) {
                throw validation_error("unknown operator '" + p.path.back() + "' in " + p.path_string());
            }
            continue;
        }

        const model_schema* current = schema;
        std::shared_ptr<const model_schema> hop;
        for (size_t i = 0; i < p.path.size(); ++i) {
            const std::string& segment = p.path[i];
            const field_spec* field = current->find(segment);
            if (field == nullptr) {
                if (i == 0) {
                    throw validation_error(current->name() + " has no field " + segment);
                }
                throw validation_error("unknown operator or field '" + segment + "' in " + p.path_string());
            }
            if (i + 1 == p.path.size()) break;

            auto* ref = dynamic_cast<const reference_field*>(field);
            if (ref == nullptr) {
                throw validation_error("unknown operator '" + p.path[i + 1] + "' for " +
                                       current->name() + "." + segment);
            }
            hop = registry_.require(ref->target_model());
            current = hop.get();
        }
    }
}

// ============================================================================
// load_scope - identity map of one execute() call
// ============================================================================
//
// Every referenced record is loaded at most once. Its instance is owned by
// the scope's graph and handed to reference fields without ownership.

class query_engine::load_scope : public relation_resolver {
public:
    explicit load_scope(query_engine& engine)
        : engine_(engine), graph_(std::make_shared<instance_graph>()) {}

    instance_list resolve(const std::string& model_name,
                          const std::vector<model_id_t>& ids,
                          int depth) override {
        auto schema = engine_.relation_schema(model_name, depth);

        std::set<model_id_t> missing;
        for (auto id : ids) {
            if (loaded_.count({model_name, id}) == 0) {
                missing.insert(id);
            }
        }
        if (!missing.empty()) {
            std::vector<std::string> keys;
            keys.reserve(missing.size());
            for (auto id : missing) {
                keys.push_back(engine_.record_key(model_name, id));
            }
            engine_.load(model_name, schema, keys, filter{}, depth, *this, true);
        }

        instance_list found;
        found.reserve(ids.size());
        for (auto id : ids) {
            auto it = loaded_.find({model_name, id});
            if (it != loaded_.end()) {
                found.push_back(instance_ptr(instance_ptr(), it->second));
            }
        }
        return found;
    }

    // Called before the record's fields are read, so a cycle back to it hits
    // the map instead of loading again
    void remember(const std::string& model_name, model_id_t id, model_instance* instance) {
        loaded_[{model_name, id}] = instance;
    }

    const std::shared_ptr<instance_graph>& graph() const { return graph_; }

private:
    query_engine& engine_;
    std::shared_ptr<instance_graph> graph_;
    std::map<std::pair<std::string, model_id_t>, model_instance*> loaded_;
};

query_set query_engine::execute(const std::string& model_name, const filter& f, int depth) {
    auto schema = registry_.get_schema(model_name);
    if (!schema) {
        if (!options_.lenient) {
            throw validation_error(model_name + " not found in registered models");
        }
        LOG_WARN("query", "%s not found in registered models, reading records as raw values", model_name.c_str());
    }
    validate(schema.get(), f);

    auto keys = record_keys(model_name);
    load_scope scope(*this);
    auto items = load(model_name, schema, keys, f, depth, scope, false);
    if (scope.graph()->size() > 0) {
        for (auto& item : items) {
            item->graph_ = scope.graph();
        }
    }
    LOG_DEBUG("query", "%s: %zu of %zu records matched, %zu referenced", model_name.c_str(),
              items.size(), keys.size(), scope.graph()->size());

    auto result_schema = schema ? schema : std::make_shared<const model_schema>(model_name);
    return query_set(std::move(result_schema), std::move(items));
}

std::shared_ptr<const model_schema> query_engine::relation_schema(const std::string& model_name,
                                                                  int depth) const {
    if (depth > options_.max_relation_depth) {
        throw relation_error("reference chain to " + model_name + " is deeper than " +
                             std::to_string(options_.max_relation_depth) + " levels");
    }
    auto schema = registry_.get_schema(model_name);
    if (!schema) {
        throw relation_error("referenced model " + model_name + " is not registered");
    }
    return schema;
}

instance_list query_engine::resolve(const std::string& model_name,
                                    const std::vector<model_id_t>& ids,
                                    int depth) {
    load_scope scope(*this);
    auto found = scope.resolve(model_name, ids, depth);
    // Handed to the caller: each instance keeps the whole graph alive
    for (auto& item : found) {
        item = instance_ptr(scope.graph(), item.get());
    }
    return found;
}

std::optional<nlohmann::json> query_engine::load_record(const std::string& model_name, model_id_t id) {
    auto text = store_.get(record_key(model_name, id));
    if (!text) {
        return std::nullopt;
    }
    auto record = nlohmann::json::parse(*text, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        reject("record " + record_key(model_name, id) + " is not a JSON object");
        return std::nullopt;
    }
    return record;
}

instance_list query_engine::load(const std::string& model_name,
                                 const std::shared_ptr<const model_schema>& schema,
                                 const std::vector<std::string>& keys,
                                 const filter& f,
                                 int depth,
                                 load_scope& scope,
                                 bool members) {
    std::vector<std::string> valid_keys;
    std::vector<model_id_t> key_ids;
    valid_keys.reserve(keys.size());
    key_ids.reserve(keys.size());
    for (const auto& key : keys) {
        auto id = id_from_key(model_name, key);
        if (!id) {
            reject("key " + key + " does not end with a numeric id");
            continue;
        }
        valid_keys.push_back(key);
        key_ids.push_back(*id);
    }

    auto texts = valid_keys.empty() ? std::vector<std::optional<std::string>>{} : store_.multi_get(valid_keys);

    deserialize_context ctx;
    ctx.lenient = options_.lenient;
    ctx.resolver = &scope;
    ctx.depth = depth;

    instance_list result;
    for (size_t r = 0; r < valid_keys.size(); ++r) {
        if (!texts[r]) {
            continue;  // removed since enumeration
        }
        auto record = nlohmann::json::parse(*texts[r], nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            reject("record " + valid_keys[r] + " is not a JSON object");
            continue;
        }

        auto record_schema = schema ? schema
                                    : std::make_shared<const model_schema>(model_schema::opaque(model_name, record));

        // Opaque records may lack a filtered field; it reads as null
        bool rejected = false;
        for (const auto& p : f.predicates()) {
            if (!record_schema->has_field(p.path.front()) && !matches(p, std::monostate{})) {
                rejected = true;
                break;
            }
        }
        if (rejected) continue;

        // Reference targets are never filtered, so they can join the graph
        // before their own references are resolved
        instance_ptr target;
        if (members) {
            target = std::make_shared<model_instance>(record_schema);
            target->member_of_ = scope.graph();
            scope.graph()->adopt(target);
            scope.remember(model_name, key_ids[r], target.get());
        }

        std::vector<value_t> values;
        values.reserve(record_schema->size());
        for (const auto& entry : record_schema->fields()) {
            nlohmann::json raw = record.contains(entry.name) ? record[entry.name] : nlohmann::json(nullptr);
            if (entry.name == "id" && raw.is_null()) {
                raw = key_ids[r];
            }
            value_t value = entry.prototype->deserialize(raw, ctx);

            if (target) {
                target->field(entry.name).set_value(std::move(value));
                continue;
            }

            for (const auto& p : f.predicates()) {
                if (p.path.front() != entry.name) continue;

                value_t current = value;
                bool broken_chain = false;
                for (size_t i = 1; i < p.path.size(); ++i) {
                    auto* next = std::get_if<instance_ptr>(&current);
                    if (next == nullptr || !*next) {
                        broken_chain = true;
                        break;
                    }
                    current = (*next)->get(p.path[i]);
                }
                bool ok = broken_chain ? matches(p, std::monostate{}) && p.op == filter_op::isnull
                                       : matches(p, current);
                if (!ok) {
                    rejected = true;
                    break;
                }
            }
            if (rejected) break;
            values.push_back(std::move(value));
        }
        if (target) {
            result.push_back(std::move(target));
            continue;
        }
        if (rejected) continue;

        auto instance = std::make_shared<model_instance>(record_schema);
        for (size_t i = 0; i < values.size(); ++i) {
            instance->field(record_schema->fields()[i].name).set_value(std::move(values[i]));
        }
        result.push_back(std::move(instance));
    }
    return result;
}

} // namespace keystone
