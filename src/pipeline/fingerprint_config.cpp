#include "fingerprint_config.h"

#include <iostream>
#include <limits>

namespace tefp {
namespace {

void require(bool ok, const std::string& parameter, const std::string& constraint, int64_t value) {
    if (!ok) {
        throw ConfigError("invalid " + parameter + " = " + std::to_string(value) + ": must be " + constraint);
    }
}

}  // namespace

void validate_config(const FingerprintConfig& config) {
    require(config.epsilon >= 0, "epsilon", ">= 0", config.epsilon);
    require(config.minimum_points >= 1, "minimum_points", ">= 1", config.minimum_points);
    require(config.buffer_margin >= 0, "buffer_margin", ">= 0", config.buffer_margin);
    require(config.join_distance >= 0, "join_distance", ">= 0", config.join_distance);
    require(config.n_common_elements >= 1, "n_common_elements", ">= 1", config.n_common_elements);
    require(config.threads >= 1, "threads", ">= 1", config.threads);
    require(config.min_mapq >= 0, "min_mapq", ">= 0", config.min_mapq);
    require(config.min_mapq <= 255, "min_mapq", "<= 255", config.min_mapq);

    switch (config.method) {
        case SplitMethod::kNonHierarchical:
            break;
        case SplitMethod::kAggressive:
            std::cerr << "[Config] sdbican-aggressive is deprecated; use sdbican\n";
            [[fallthrough]];
        case SplitMethod::kConservative:
            require(config.minimum_epsilon >= 0, "minimum_epsilon", ">= 0", config.minimum_epsilon);
            require(config.minimum_epsilon < config.epsilon, "minimum_epsilon",
                    "< epsilon (" + std::to_string(config.epsilon) + ")", config.minimum_epsilon);
            break;
        default:
            throw ConfigError("invalid splitting method");
    }

    if (config.element_tag.size() != 2) {
        throw ConfigError("invalid element_tag '" + config.element_tag + "': must be a two character SAM tag");
    }
}

int32_t narrow_int32(const std::string& parameter, int64_t value) {
    require(value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max(),
            parameter, "a 32-bit integer", value);
    return static_cast<int32_t>(value);
}

SplitMethod parse_split_method(const std::string& name) {
    if (name == "idbcan") return SplitMethod::kNonHierarchical;
    if (name == "sdbican") return SplitMethod::kConservative;
    if (name == "sdbican-aggressive") return SplitMethod::kAggressive;
    throw ConfigError("invalid splitting method '" + name +
                      "': must be one of idbcan, sdbican, sdbican-aggressive");
}

}  // namespace tefp
