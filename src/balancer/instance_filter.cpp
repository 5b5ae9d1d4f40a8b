#include "balancer/instance_filter.hpp"

namespace meshguard {

InstanceFilter::InstanceFilter(bool health_check_enabled, std::string healthy_status)
    : health_check_enabled_(health_check_enabled),
      healthy_status_(std::move(healthy_status)) {}

std::vector<ServiceInstancePtr> InstanceFilter::apply(
    const std::vector<ServiceInstancePtr>& candidates) const {
    std::vector<ServiceInstancePtr> healthy;
    healthy.reserve(candidates.size());
    for (const auto& instance : candidates) {
        if (instance && is_healthy(*instance)) {
            healthy.push_back(instance);
        }
    }
    return healthy;
}

bool InstanceFilter::is_healthy(const ServiceInstance& instance) const {
    return !health_check_enabled_ || instance.health.status == healthy_status_;
}

} // namespace meshguard
