/**
 * @file path_migration.h
 * @brief Main header for path_migration_system library
 * @version 0.1.0
 *
 * This is the primary include file for the path_migration_system library.
 * Include this header to access connection migration functionality.
 *
 * @code
 * #include <kcenon/path_migration/path_migration.h>
 *
 * using namespace kcenon::path_migration;
 *
 * std::shared_ptr<path_transport> transport = udp_path_transport::create();
 * auto connection = quic_connection::create(transport, handshake);
 *
 * // Move the transfer to Wi-Fi
 * auto report = connection.value()->migrate_to(migration_target::from_interface("wlan0"));
 * @endcode
 */

#ifndef KCENON_PATH_MIGRATION_PATH_MIGRATION_H
#define KCENON_PATH_MIGRATION_PATH_MIGRATION_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/path_migration/core/types.h"
#include "kcenon/path_migration/core/connection_id.h"
#include "kcenon/path_migration/core/logging.h"

// Connection
#include "kcenon/path_migration/connection/connection_config.h"
#include "kcenon/path_migration/connection/connection_id_pool.h"
#include "kcenon/path_migration/connection/network_path.h"
#include "kcenon/path_migration/connection/path_table.h"
#include "kcenon/path_migration/connection/quic_connection.h"

// Validation, migration, continuity
#include "kcenon/path_migration/validation/path_validator.h"
#include "kcenon/path_migration/migration/migration_types.h"
#include "kcenon/path_migration/migration/migration_coordinator.h"
#include "kcenon/path_migration/continuity/transfer_continuity_bridge.h"

// Transport
#include "kcenon/path_migration/transport/path_frames.h"
#include "kcenon/path_migration/transport/path_transport.h"
#include "kcenon/path_migration/transport/udp_path_transport.h"
#include "kcenon/path_migration/transport/interface_resolver.h"

namespace kcenon::path_migration {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_PATH_MIGRATION_H
