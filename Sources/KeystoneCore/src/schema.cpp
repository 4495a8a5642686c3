#include "keystone/schema.hpp"
#include "keystone/log.hpp"

namespace keystone {

model_schema::model_schema(std::string name) : name_(std::move(name)) {
    fields_.push_back({"id", std::make_shared<id_field>()});
}

model_schema::model_schema(std::string name, const model_schema& base)
    : name_(std::move(name)), fields_(base.fields_) {}

model_schema& model_schema::add(const std::string& field_name, const field_spec& spec) {
    if (field_name.empty()) {
        throw validation_error("model " + name_ + ": field name can not be empty");
    }
    if (field_name.find("__") != std::string::npos) {
        throw validation_error("model " + name_ + ": field name " + field_name + " can not contain '__'");
    }
    if (has_field(field_name)) {
        throw validation_error("model " + name_ + " already has a field " + field_name);
    }
    fields_.push_back({field_name, std::shared_ptr<const field_spec>(spec.clone())});
    return *this;
}

const field_spec* model_schema::find(const std::string& field_name) const {
    for (const auto& entry : fields_) {
        if (entry.name == field_name) {
            return entry.prototype.get();
        }
    }
    return nullptr;
}

std::vector<std::string> model_schema::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& entry : fields_) {
        names.push_back(entry.name);
    }
    return names;
}

model_schema model_schema::opaque(const std::string& name, const nlohmann::json& record) {
    model_schema schema(name);
    if (record.is_object()) {
        for (const auto& [key, _] : record.items()) {
            if (key != "id" && key.find("__") == std::string::npos) {
                schema.add(key, raw_field());
            }
        }
    }
    return schema;
}

// ============================================================================
// schema_registry
// ============================================================================

std::shared_ptr<const model_schema> schema_registry::register_model(model_schema schema) {
    const std::string name = schema.name();
    if (name.empty() || name.find(':') != std::string::npos) {
        throw validation_error("invalid model name '" + name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (schemas_by_name_.count(name)) {
        throw validation_error("model " + name + " is already registered");
    }
    for (const auto& entry : schema.fields()) {
        const std::string* target = reference_target(*entry.prototype);
        if (target && *target != name && !schemas_by_name_.count(*target)) {
            throw validation_error(name + "." + entry.name + " references " + *target +
                                   ", which is not a registered model");
        }
    }

    auto stored = std::make_shared<const model_schema>(std::move(schema));
    schemas_by_name_[name] = stored;
    order_.push_back(name);
    LOG_DEBUG("schema", "registered model %s (%zu fields)", name.c_str(), stored->size());
    return stored;
}

std::shared_ptr<const model_schema> schema_registry::get_schema(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schemas_by_name_.find(model_name);
    if (it == schemas_by_name_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<const model_schema> schema_registry::require(const std::string& model_name) const {
    auto schema = get_schema(model_name);
    if (!schema) {
        throw validation_error(model_name + " not found in registered models");
    }
    return schema;
}

bool schema_registry::contains(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schemas_by_name_.count(model_name) != 0;
}

std::vector<std::shared_ptr<const model_schema>> schema_registry::all_schemas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const model_schema>> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.push_back(schemas_by_name_.at(name));
    }
    return result;
}

} // namespace keystone
