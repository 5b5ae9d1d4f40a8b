#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace meshguard::testing {

/**
 * @brief Build a candidate for selection tests
 */
inline ServiceInstancePtr make_instance(const std::string& id, int weight = 0,
                                        const std::string& status = "passing") {
    auto inst = std::make_shared<ServiceInstance>();
    inst->id = id;
    inst->service_name = "svc";
    inst->address = "127.0.0.1";
    inst->port = 9000;
    inst->weight = weight;
    inst->health.status = status;
    return inst;
}

inline std::vector<ServiceInstancePtr> make_instances(const std::vector<std::string>& ids) {
    std::vector<ServiceInstancePtr> out;
    out.reserve(ids.size());
    for (const auto& id : ids) out.push_back(make_instance(id));
    return out;
}

} // namespace meshguard::testing
