/**
 * @file connection_config.h
 * @brief Connection configuration and builder
 */

#ifndef KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_CONFIG_H
#define KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "kcenon/path_migration/connection/connection_id_pool.h"
#include "kcenon/path_migration/continuity/transfer_continuity_bridge.h"
#include "kcenon/path_migration/core/connection_id.h"
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/migration/migration_types.h"
#include "kcenon/path_migration/validation/path_validator.h"

namespace kcenon::path_migration {

/**
 * @brief Configuration of one migrating connection
 */
struct connection_config {
    connection_id_pool_config pool;
    validator_config validation;
    migration_config migration;
    continuity_config continuity;

    /// Close the connection when nothing was received for this long
    std::chrono::milliseconds idle_timeout{30000};

    /// Local IDs generated and advertised right after the handshake
    std::size_t initial_advertised_ids = 0;

    /**
     * @brief Check value ranges
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (pool.connection_id_length < 4 || pool.connection_id_length > max_connection_id_length) {
            return unexpected(error(error_code::invalid_configuration,
                "connection_id_length must be within 4..20"));
        }
        if (pool.max_local_ids < 2 || pool.max_peer_ids < 1) {
            return unexpected(error(error_code::invalid_configuration,
                "ID limits must allow at least two local IDs and one peer ID"));
        }
        if (initial_advertised_ids >= pool.max_local_ids) {
            return unexpected(error(error_code::invalid_configuration,
                "initial_advertised_ids must leave room in max_local_ids"));
        }
        if (validation.challenge_timeout.count() <= 0) {
            return unexpected(error(error_code::invalid_configuration,
                "challenge_timeout must be positive"));
        }
        if (migration.retirement_grace_period.count() < 0) {
            return unexpected(error(error_code::invalid_configuration,
                "retirement_grace_period must not be negative"));
        }
        if (migration.max_peer_validations == 0) {
            return unexpected(error(error_code::invalid_configuration,
                "max_peer_validations must be at least 1"));
        }
        if (continuity.max_segment_size == 0 ||
            continuity.max_segment_size > std::numeric_limits<uint16_t>::max()) {
            return unexpected(error(error_code::invalid_configuration,
                "max_segment_size must be within 1..65535"));
        }
        if (idle_timeout.count() <= 0) {
            return unexpected(error(error_code::invalid_configuration,
                "idle_timeout must be positive"));
        }
        return {};
    }
};

/**
 * @brief Fluent builder for connection_config
 *
 * @code
 * auto config = connection_config_builder()
 *     .with_challenge_timeout(std::chrono::milliseconds{500})
 *     .with_max_retries(2)
 *     .with_retirement_grace_period(std::chrono::seconds{1})
 *     .build();
 * @endcode
 */
class connection_config_builder {
public:
    connection_config_builder() = default;

    auto with_connection_id_length(std::size_t length) -> connection_config_builder& {
        config_.pool.connection_id_length = length;
        return *this;
    }

    auto with_id_limits(std::size_t max_local, std::size_t max_peer) -> connection_config_builder& {
        config_.pool.max_local_ids = max_local;
        config_.pool.max_peer_ids = max_peer;
        return *this;
    }

    auto with_challenge_timeout(std::chrono::milliseconds timeout) -> connection_config_builder& {
        config_.validation.challenge_timeout = timeout;
        return *this;
    }

    auto with_max_retries(uint32_t retries) -> connection_config_builder& {
        config_.validation.max_retries = retries;
        return *this;
    }

    auto with_fresh_peer_id(bool require) -> connection_config_builder& {
        config_.migration.require_fresh_peer_id = require;
        return *this;
    }

    auto with_retirement_grace_period(std::chrono::milliseconds period)
        -> connection_config_builder& {
        config_.migration.retirement_grace_period = period;
        return *this;
    }

    auto with_peer_address_validation(bool enable) -> connection_config_builder& {
        config_.migration.validate_peer_address_change = enable;
        return *this;
    }

    auto with_max_peer_validations(std::size_t count) -> connection_config_builder& {
        config_.migration.max_peer_validations = count;
        return *this;
    }

    auto with_max_segment_size(std::size_t size) -> connection_config_builder& {
        config_.continuity.max_segment_size = size;
        return *this;
    }

    auto with_idle_timeout(std::chrono::milliseconds timeout) -> connection_config_builder& {
        config_.idle_timeout = timeout;
        return *this;
    }

    auto with_initial_advertised_ids(std::size_t count) -> connection_config_builder& {
        config_.initial_advertised_ids = count;
        return *this;
    }

    /**
     * @brief Build and validate
     * @return invalid_configuration when a value is out of range
     */
    [[nodiscard]] auto build() const -> result<connection_config> {
        auto valid = config_.validate();
        if (!valid) {
            return unexpected(valid.error());
        }
        return config_;
    }

private:
    connection_config config_;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_CONNECTION_CONNECTION_CONFIG_H
