#include "dmsync/configuration/sync_config.hpp"
#include "dmsync/core/format.hpp"

namespace dmsync::configuration {

namespace {
    constexpr const char* DEFAULT_DISCOVERY_RELAYS[] = {
        "wss://relay.damus.io",
        "wss://nos.lol",
        "wss://relay.primal.net",
    };
}

SyncConfig SyncConfig::Default() {
    SyncConfig config;
    for (const char* relay : DEFAULT_DISCOVERY_RELAYS) {
        config.discovery_relays.emplace_back(relay);
    }
    return config;
}

Result<Unit, DmFailure> SyncConfig::Validate() const {
    if (discovery_relays.empty()) {
        return Result<Unit, DmFailure>::Err(
            DmFailure::InvalidInput("discovery_relays must not be empty"));
    }
    for (const auto& relay : discovery_relays) {
        if (relay.empty()) {
            return Result<Unit, DmFailure>::Err(
                DmFailure::InvalidInput("discovery_relays contains an empty URL"));
        }
    }
    if (batch_size == 0) {
        return Result<Unit, DmFailure>::Err(
            DmFailure::InvalidInput("batch_size must be positive"));
    }
    if (query_limit < batch_size) {
        return Result<Unit, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format(
                "query_limit ({}) must be at least batch_size ({})", query_limit, batch_size)));
    }
    if (!(discovery_majority_ratio > 0.0 && discovery_majority_ratio <= 1.0)) {
        return Result<Unit, DmFailure>::Err(
            DmFailure::InvalidInput("discovery_majority_ratio must be in (0, 1]"));
    }
    if (query_timeout.count() <= 0) {
        return Result<Unit, DmFailure>::Err(
            DmFailure::InvalidInput("query_timeout must be positive"));
    }
    return Result<Unit, DmFailure>::Ok(unit);
}

const char* RelayModeToString(const RelayMode mode) noexcept {
    switch (mode) {
        case RelayMode::Discovery: return "discovery";
        case RelayMode::Hybrid: return "hybrid";
        case RelayMode::StrictOutbox: return "strict_outbox";
        default: return "unknown";
    }
}

}
