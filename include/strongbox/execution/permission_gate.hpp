#pragma once

#include <strongbox/execution/state.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/role_id.hpp>
#include <strongbox/schema/transaction_error_code.hpp>
#include <strongbox/schema/upsert_role_assignment.hpp>
#include <optional>

namespace strongbox::execution {

/// Flat two-role permission model (admin, operator).
class permission_gate final {
 public:
  explicit permission_gate(state& state);

  bool has_role(const strongbox::schema::principal_id_t& principal,
                strongbox::schema::role_id_t role) const;

  /// std::nullopt when `principal` holds `role`, `unauthorized` otherwise.
  std::optional<strongbox::schema::transaction_error_code> require(
      const strongbox::schema::principal_id_t& principal,
      strongbox::schema::role_id_t role) const;

  /// Persist an assignment without any role check (bootstrap path).
  void assign(const strongbox::schema::role_assignment_state_t& assignment);

  /// Admin-only grant/revoke.
  std::optional<strongbox::schema::transaction_error_code> upsert(
      const strongbox::schema::principal_id_t& caller,
      const strongbox::schema::upsert_role_assignment_t& assignment);

 private:
  state& state_;
};

}  // namespace strongbox::execution
