#pragma once

#include <strongbox/schema/primitives.hpp>

namespace strongbox::execution {

/// Moves real funds between a principal and the ledger's custody.
///
/// Implementations may call back into the engine before returning. The engine
/// stages its own state change before calling either method.
class external_transfer {
 public:
  virtual ~external_transfer() = default;

  /// Inbound leg of a deposit. Returns false if the funds were not received.
  virtual bool pull_from(const strongbox::schema::principal_id_t& principal,
                         const strongbox::schema::asset_id_t& asset_id,
                         const strongbox::schema::amount_t& amount) = 0;

  /// Outbound leg of a withdrawal. Returns false if the funds were not sent.
  virtual bool push_to(const strongbox::schema::principal_id_t& principal,
                       const strongbox::schema::asset_id_t& asset_id,
                       const strongbox::schema::amount_t& amount) = 0;
};

}  // namespace strongbox::execution
