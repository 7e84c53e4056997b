/**
 * @file interface_resolver.h
 * @brief Resolve a network interface name to its address
 */

#ifndef KCENON_PATH_MIGRATION_TRANSPORT_INTERFACE_RESOLVER_H
#define KCENON_PATH_MIGRATION_TRANSPORT_INTERFACE_RESOLVER_H

#include <memory>
#include <string>
#include <vector>

#include "kcenon/path_migration/core/types.h"

namespace kcenon::path_migration {

/**
 * @brief Network interface information
 */
struct network_interface {
    std::string name;
    std::string address;
    bool is_up = false;
    bool is_loopback = false;
};

/**
 * @brief Interface lookup
 */
class interface_resolver {
public:
    virtual ~interface_resolver() = default;

    /**
     * @brief IPv4 address of an interface that is up
     * @return no_route style error (migration_failed) when unknown or down
     */
    [[nodiscard]] virtual auto resolve(const std::string& name) const -> result<std::string> = 0;

    [[nodiscard]] virtual auto list() const -> std::vector<network_interface> = 0;
};

/**
 * @brief getifaddrs() based resolver
 */
class system_interface_resolver : public interface_resolver {
public:
    [[nodiscard]] static auto create() -> std::unique_ptr<system_interface_resolver>;

    [[nodiscard]] auto resolve(const std::string& name) const -> result<std::string> override;
    [[nodiscard]] auto list() const -> std::vector<network_interface> override;
};

}  // namespace kcenon::path_migration

#endif  // KCENON_PATH_MIGRATION_TRANSPORT_INTERFACE_RESOLVER_H
