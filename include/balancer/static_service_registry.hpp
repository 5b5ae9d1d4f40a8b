#pragma once

#include "balancer/iservice_registry.hpp"
#include "core/error.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshguard {

/**
 * @brief Fixed registry built from "host:port,host:port" address lists.
 *
 * Instances are named "<service>-<index>", tagged "static" and reported
 * as passing. Used where no live registry is wired in.
 */
class StaticServiceRegistry : public IServiceRegistry {
public:
    StaticServiceRegistry() = default;

    /**
     * @brief Parse service → comma-separated address list
     * @return Registry, or CONFIG_ERROR on a malformed address
     */
    [[nodiscard]] static Result<StaticServiceRegistry> from_addresses(
        const std::map<std::string, std::string>& services);

    [[nodiscard]] std::vector<ServiceInstancePtr> list_instances(
        const std::string& service_name) const override;

    [[nodiscard]] std::vector<std::string> service_names() const;

    void add_instance(ServiceInstance instance);

private:
    std::unordered_map<std::string, std::vector<ServiceInstancePtr>> services_;
};

} // namespace meshguard
