#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace meshguard {

/**
 * @brief Drops candidates that are not healthy before selection.
 *
 * With health checking disabled every non-null candidate passes. Relative
 * order is preserved so order-sensitive strategies stay stable.
 */
class InstanceFilter {
public:
    explicit InstanceFilter(bool health_check_enabled = true,
                            std::string healthy_status = std::string(kHealthPassing));

    [[nodiscard]] std::vector<ServiceInstancePtr> apply(
        const std::vector<ServiceInstancePtr>& candidates) const;

    [[nodiscard]] bool is_healthy(const ServiceInstance& instance) const;

    bool health_check_enabled() const { return health_check_enabled_; }
    const std::string& healthy_status() const { return healthy_status_; }

private:
    bool health_check_enabled_;
    std::string healthy_status_;
};

} // namespace meshguard
