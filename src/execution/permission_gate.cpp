#include <spdlog/spdlog.h>
#include <strongbox/execution/permission_gate.hpp>
#include <strongbox/schema/key/engine_keys.hpp>

namespace strongbox::execution {

permission_gate::permission_gate(state& state) : state_{state} {}

bool permission_gate::has_role(
    const strongbox::schema::principal_id_t& principal,
    const strongbox::schema::role_id_t role) const {
  auto encoder = encoder_t{};
  auto assignment = state_.get<strongbox::schema::role_assignment_state_t>(
      strongbox::schema::key::make_role_assignment_key(encoder, principal,
                                                       role));
  return assignment.has_value() && assignment->enabled;
}

std::optional<strongbox::schema::transaction_error_code>
permission_gate::require(const strongbox::schema::principal_id_t& principal,
                         const strongbox::schema::role_id_t role) const {
  if (has_role(principal, role)) {
    return std::nullopt;
  }
  spdlog::debug("Principal {} lacks role '{}'",
                strongbox::schema::to_hex(principal),
                strongbox::schema::to_string(role));
  return strongbox::schema::transaction_error_code::unauthorized;
}

void permission_gate::assign(
    const strongbox::schema::role_assignment_state_t& assignment) {
  auto encoder = encoder_t{};
  state_.put(strongbox::schema::key::make_role_assignment_key(
                 encoder, assignment.subject, assignment.role),
             assignment);
}

std::optional<strongbox::schema::transaction_error_code>
permission_gate::upsert(
    const strongbox::schema::principal_id_t& caller,
    const strongbox::schema::upsert_role_assignment_t& assignment) {
  if (auto denied = require(caller, strongbox::schema::role_id_t::admin)) {
    return denied;
  }
  assign(assignment);
  return std::nullopt;
}

}  // namespace strongbox::execution
