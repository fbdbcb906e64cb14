#pragma once

// TetherCore - entity state tracking for an object-relational mapper
//
// Usage:
//   #include <TetherCore.hpp>
//
//   tether::basic_entity_manager em;
//   tether::class_metadata user("User");
//   user.set_identifier({"id"})
//       .add_field("name")
//       .add_field("active", tether::field_type::boolean);
//   em.register_class(std::move(user));
//
//   auto u = em.create("User");               // New
//   u->set_value("name", std::string("Ada"));  // recorded in the change set
//   auto payload = u->build_write_payload();   // {name: "Ada"}
//   u->assign_identifier(int64_t{1});          // Managed, change set cleared

#include "tether/log.hpp"
#include "tether/types.hpp"
#include "tether/errors.hpp"
#include "tether/configuration.hpp"
#include "tether/codec.hpp"
#include "tether/class_metadata.hpp"
#include "tether/collection.hpp"
#include "tether/db.hpp"
#include "tether/connection.hpp"
#include "tether/entity_manager.hpp"
#include "tether/entity.hpp"
