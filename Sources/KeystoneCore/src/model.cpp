#include "keystone/model.hpp"
#include "keystone/schema.hpp"

namespace keystone {

namespace {

template<typename Fn>
void for_each_reference(value_t& value, Fn&& fn) {
    if (auto* one = std::get_if<instance_ptr>(&value)) {
        fn(*one);
    } else if (auto* many = std::get_if<instance_list>(&value)) {
        for (auto& ref : *many) {
            fn(ref);
        }
    }
}

// Non-null with an empty control block: an edge inside a graph, or a
// self-reference
bool is_unowned(const instance_ptr& ref) {
    return ref && ref.use_count() == 0;
}

} // namespace

model_instance::model_instance(std::shared_ptr<const model_schema> schema)
    : schema_(std::move(schema)) {
    fields_.reserve(schema_->size());
    for (const auto& entry : schema_->fields()) {
        fields_.emplace_back(entry.name, entry.prototype->clone());
    }
}

model_instance::model_instance(const model_instance& other)
    : std::enable_shared_from_this<model_instance>(), schema_(other.schema_) {
    fields_.reserve(other.fields_.size());
    for (const auto& [name, field] : other.fields_) {
        fields_.emplace_back(name, field->clone());
        // The copy owns what it refers to
        fields_.back().second->set_value(other.get(name));
    }
}

model_instance& model_instance::operator=(const model_instance& other) {
    if (this != &other) {
        model_instance copy(other);
        *this = std::move(copy);
    }
    return *this;
}

const std::string& model_instance::model_name() const {
    return schema_->name();
}

std::optional<model_id_t> model_instance::id() const {
    const auto* f = find("id");
    if (f == nullptr) {
        return std::nullopt;
    }
    if (auto* id = std::get_if<int64_t>(&(*f)->value())) {
        return *id;
    }
    return std::nullopt;
}

bool model_instance::contains(const std::string& field_name) const {
    return find(field_name) != nullptr;
}

std::unique_ptr<field_spec>* model_instance::find(const std::string& field_name) {
    for (auto& [name, field] : fields_) {
        if (name == field_name) return &field;
    }
    return nullptr;
}

const std::unique_ptr<field_spec>* model_instance::find(const std::string& field_name) const {
    for (const auto& [name, field] : fields_) {
        if (name == field_name) return &field;
    }
    return nullptr;
}

field_spec& model_instance::field(const std::string& field_name) {
    auto* f = find(field_name);
    if (f == nullptr) {
        throw validation_error(model_name() + " has no field " + field_name);
    }
    return **f;
}

const field_spec& model_instance::field(const std::string& field_name) const {
    const auto* f = find(field_name);
    if (f == nullptr) {
        throw validation_error(model_name() + " has no field " + field_name);
    }
    return **f;
}

value_t model_instance::get(const std::string& field_name) const {
    value_t value = field(field_name).value();
    share_references(value);
    return value;
}

void model_instance::share_references(value_t& value) const {
    auto owner = member_of_.lock();
    bool member = owner != nullptr;
    if (!member) {
        owner = graph_;
    }
    for_each_reference(value, [&](instance_ptr& ref) {
        if (!is_unowned(ref)) return;
        if (ref.get() == this && !member) {
            if (auto self = weak_from_this().lock()) {
                ref = std::const_pointer_cast<model_instance>(self);
            }
        } else if (owner) {
            ref = instance_ptr(owner, ref.get());
        }
    });
}

void model_instance::set(const std::string& field_name, value_t value) {
    if (field_name == "id" && contains("id")) {
        throw validation_error(model_name() + ".id is assigned on save and can not be set");
    }
    write(field_name, std::move(value));
}

void model_instance::write(const std::string& field_name, value_t value) {
    auto& f = field(field_name);
    for_each_reference(value, [this](instance_ptr& ref) {
        if (ref.get() == this) {
            ref = instance_ptr(instance_ptr(), this);
        }
    });
    f.set_value(std::move(value));
}

void model_instance::assign(const value_map& values) {
    for (const auto& [name, _] : values) {
        if (!contains(name)) {
            throw validation_error(model_name() + " has no field " + name);
        }
        if (name == "id") {
            throw validation_error(model_name() + ".id is assigned on save and can not be set");
        }
    }
    for (const auto& [name, value] : values) {
        write(name, value);
    }
}

void model_instance::assign_id(model_id_t id) {
    field("id").set_value(id);
}

bool model_instance::operator==(const model_instance& other) const {
    if (model_name() != other.model_name() || fields_.size() != other.fields_.size()) {
        return false;
    }
    for (size_t i = 0; i < fields_.size(); ++i) {
        const auto& [name, field] = fields_[i];
        const auto& [other_name, other_field] = other.fields_[i];
        if (name != other_name) return false;
        const value_t& a = field->value();
        const value_t& b = other_field->value();
        if (a.index() != b.index() && !(is_null(a) && is_null(b))) return false;
        if (!values_equal(a, b)) return false;
    }
    return true;
}

} // namespace keystone
