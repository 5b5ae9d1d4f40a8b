#include "balancer/static_service_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <memory>

namespace meshguard {

Result<StaticServiceRegistry> StaticServiceRegistry::from_addresses(
    const std::map<std::string, std::string>& services) {
    StaticServiceRegistry registry;

    for (const auto& [service_name, addresses] : services) {
        size_t index = 0;
        size_t pos = 0;
        while (pos <= addresses.size()) {
            const size_t comma = std::min(addresses.find(',', pos), addresses.size());
            const std::string addr = utils::trim(addresses.substr(pos, comma - pos));
            pos = comma + 1;
            if (addr.empty()) continue;

            const auto colon = addr.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                return Result<StaticServiceRegistry>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("invalid address format for '{}': {}", service_name, addr));
            }

            uint16_t port = 0;
            const char* begin = addr.data() + colon + 1;
            const char* end = addr.data() + addr.size();
            const auto [ptr, ec] = std::from_chars(begin, end, port);
            if (ec != std::errc{} || ptr != end || port == 0) {
                return Result<StaticServiceRegistry>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("invalid port for '{}': {}", service_name, addr));
            }

            ServiceInstance instance;
            instance.id = std::format("{}-{}", service_name, index++);
            instance.service_name = service_name;
            instance.address = addr.substr(0, colon);
            instance.port = port;
            instance.tags = {"static"};
            instance.meta = {{"type", "static"}};
            instance.health.status = std::string(kHealthPassing);
            instance.health.last_checked = std::chrono::system_clock::now();
            registry.add_instance(std::move(instance));
        }
    }

    utils::log::info(std::format("Static service registry initialized with {} services",
                                 registry.services_.size()));
    return Result<StaticServiceRegistry>::ok(std::move(registry));
}

std::vector<ServiceInstancePtr> StaticServiceRegistry::list_instances(
    const std::string& service_name) const {
    const auto it = services_.find(service_name);
    if (it == services_.end()) return {};
    return it->second;
}

std::vector<std::string> StaticServiceRegistry::service_names() const {
    std::vector<std::string> names;
    names.reserve(services_.size());
    for (const auto& [name, instances] : services_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void StaticServiceRegistry::add_instance(ServiceInstance instance) {
    auto& bucket = services_[instance.service_name];
    bucket.push_back(std::make_shared<const ServiceInstance>(std::move(instance)));
}

} // namespace meshguard
