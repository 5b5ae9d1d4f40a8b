#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace meshguard {

/**
 * @brief Abstract service registry interface
 *
 * The source of raw candidates for selection. Implementations own instance
 * registration, heartbeats and health probing; this layer only reads.
 */
class IServiceRegistry {
public:
    virtual ~IServiceRegistry() = default;

    /**
     * @brief All known instances of a service, healthy or not.
     *        Unknown services yield an empty list.
     */
    [[nodiscard]] virtual std::vector<ServiceInstancePtr> list_instances(
        const std::string& service_name) const = 0;
};

} // namespace meshguard
