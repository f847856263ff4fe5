#include "market/access_controller.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace pmkt {

void AccessController::initialize(const Address& admin, const Address& oracle,
                                  const CallContext& ctx) {
    if (!ctx.authorized_by(admin)) {
        throw MarketError(ErrorCode::UNAUTHORIZED_ADMIN, "initialize not signed by admin");
    }

    if (is_initialized()) {
        throw MarketError(ErrorCode::ALREADY_INITIALIZED);
    }

    state_.set_roles(admin, oracle);
    spdlog::info("Market initialized: admin={} oracle={}", admin, oracle);
}

bool AccessController::is_initialized() const {
    return state_.admin().has_value();
}

Address AccessController::require_admin(const CallContext& ctx) const {
    auto admin = state_.admin();
    if (!admin) {
        throw MarketError(ErrorCode::ADMIN_NOT_SET);
    }
    if (!ctx.authorized_by(*admin)) {
        throw MarketError(ErrorCode::UNAUTHORIZED_ADMIN);
    }
    return *admin;
}

Address AccessController::require_oracle(const CallContext& ctx) const {
    auto oracle = state_.oracle();
    if (!oracle) {
        throw MarketError(ErrorCode::ORACLE_NOT_SET);
    }
    if (!ctx.authorized_by(*oracle)) {
        throw MarketError(ErrorCode::UNAUTHORIZED_ORACLE);
    }
    return *oracle;
}

void AccessController::require_user(const Address& user, const CallContext& ctx) const {
    if (!ctx.authorized_by(user)) {
        throw MarketError(ErrorCode::UNAUTHORIZED_USER, user);
    }
}

} // namespace pmkt
