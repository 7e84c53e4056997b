/**
 * @file interface_resolver.cpp
 * @brief getifaddrs based interface resolution
 */

#include "kcenon/path_migration/transport/interface_resolver.h"
#include "kcenon/path_migration/core/logging.h"

#if defined(__APPLE__) || defined(__linux__)
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace kcenon::path_migration {

auto system_interface_resolver::create() -> std::unique_ptr<system_interface_resolver> {
    return std::make_unique<system_interface_resolver>();
}

auto system_interface_resolver::list() const -> std::vector<network_interface> {
    std::vector<network_interface> interfaces;

#if defined(__APPLE__) || defined(__linux__)
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        PM_LOG_WARN(log_category::transport, "getifaddrs failed");
        return interfaces;
    }

    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr) {
            continue;
        }

        // Only IPv4 for now
        if (addr->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        network_interface iface;
        iface.name = addr->ifa_name;
        iface.is_up = (addr->ifa_flags & IFF_UP) != 0;
        iface.is_loopback = (addr->ifa_flags & IFF_LOOPBACK) != 0;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str));
        iface.address = ip_str;

        interfaces.push_back(iface);
    }

    freeifaddrs(addrs);
#endif

    return interfaces;
}

auto system_interface_resolver::resolve(const std::string& name) const -> result<std::string> {
    for (const auto& iface : list()) {
        if (iface.name != name) {
            continue;
        }
        if (!iface.is_up) {
            return unexpected(error(error_code::migration_failed, failure_reason::no_route,
                "Interface " + name + " is down"));
        }
        return iface.address;
    }
    return unexpected(error(error_code::migration_failed, failure_reason::no_route,
        "Interface " + name + " not found"));
}

}  // namespace kcenon::path_migration
