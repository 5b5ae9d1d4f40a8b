#include "core/types.hpp"
#include "core/utils.hpp"

namespace meshguard {

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(std::string(name)));

    static const std::unordered_map<std::string, Algorithm> lookup = {
        {"round_robin",          Algorithm::ROUND_ROBIN},
        {"weighted_round_robin", Algorithm::WEIGHTED_ROUND_ROBIN},
        {"least_connections",    Algorithm::LEAST_CONNECTIONS},
        {"random",               Algorithm::RANDOM},
        {"weighted_random",      Algorithm::WEIGHTED_RANDOM},
        {"consistent_hash",      Algorithm::CONSISTENT_HASH},
        {"ip_hash",              Algorithm::IP_HASH},
        {"source_hash",          Algorithm::IP_HASH},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace meshguard
