#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/role_id.hpp>

namespace strongbox::schema {

template <uint16_t Version>
struct upsert_role_assignment;

template <>
struct upsert_role_assignment<1> final {
  uint16_t version{1};
  principal_id_t subject{};
  role_id_t role{role_id_t::operator_};
  bool enabled{true};
};

using upsert_role_assignment_t = upsert_role_assignment<1>;
using role_assignment_state_t = upsert_role_assignment<1>;

}  // namespace strongbox::schema
