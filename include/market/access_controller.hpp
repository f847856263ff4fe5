#pragma once

#include "common/types.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

/**
 * Role checks for gated operations. Admin and oracle are written once by
 * initialize() and never change afterwards.
 */
class AccessController {
public:
    explicit AccessController(ContractState& state) : state_(state) {}

    // One-time role setup; the admin must authorize it
    void initialize(const Address& admin, const Address& oracle, const CallContext& ctx);

    bool is_initialized() const;

    // Throw unless the configured principal authorized the call.
    // Return the principal for logging.
    Address require_admin(const CallContext& ctx) const;
    Address require_oracle(const CallContext& ctx) const;

    // Throw unless `user` itself authorized the call
    void require_user(const Address& user, const CallContext& ctx) const;

private:
    ContractState& state_;
};

} // namespace pmkt
