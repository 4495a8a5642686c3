#pragma once

// KeystoneCore - schema-driven object mapping over a key-value store
//
// Usage:
//   #include <KeystoneCore.hpp>
//
//   int main() {
//       keystone::keystone_db db;  // in-memory SQLite, or db(keystone::configuration("path.db"))
//
//       keystone::model_schema task("Task");
//       task.add("title", keystone::string_field({.nullable = false}))
//           .add("status", keystone::string_field({
//               .default_value = std::string("ok"),
//               .choices = keystone::choice_map{{std::string("ok"), "Ok"}, {std::string("fail"), "Fail"}}}));
//       db.register_model(std::move(task));
//
//       auto t = db.create("Task", {{"title", "write docs"}});
//       for (const auto& open : db.query("Task", {{"status", "ok"}}).order_by("-id")) {
//           std::cout << open->get_as<std::string>("title") << std::endl;
//       }
//   }

#include "keystone/log.hpp"
#include "keystone/types.hpp"
#include "keystone/field.hpp"
#include "keystone/model.hpp"
#include "keystone/schema.hpp"
#include "keystone/db.hpp"
#include "keystone/store.hpp"
#include "keystone/id_allocator.hpp"
#include "keystone/query.hpp"
#include "keystone/scheduler.hpp"
#include "keystone/keystone.hpp"
