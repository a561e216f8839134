#ifndef TEFP_FINGERPRINT_CONFIG_H
#define TEFP_FINGERPRINT_CONFIG_H

#include "split_cluster.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tefp {

/**
 * ConfigError: a configuration value violates its constraint.
 * The message names the parameter and the constraint.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

struct FingerprintConfig {
    // Clustering
    int64_t epsilon = 250;
    int64_t minimum_epsilon = 0;
    int64_t minimum_points = 10;
    SplitMethod method = SplitMethod::kConservative;

    // Comparison and joining
    int64_t buffer_margin = 20;
    int64_t join_distance = 25;
    int64_t n_common_elements = 2;
    bool colour_by_proportion = true;

    // Tip extraction
    std::vector<std::string> references;  // empty: every reference
    std::vector<std::string> families;    // element name prefixes; empty: one category "."
    std::string element_tag = "ME";
    int32_t min_mapq = 30;
    bool include_soft_clips = false;

    // Execution
    int32_t threads = 1;
    bool verbose = false;
};

/**
 * Check every constraint; throws ConfigError on the first violation.
 * Logs a deprecation warning for the aggressive splitting method.
 */
void validate_config(const FingerprintConfig& config);

// value as int32_t; throws ConfigError naming parameter when it does not fit.
int32_t narrow_int32(const std::string& parameter, int64_t value);

// "idbcan" | "sdbican" | "sdbican-aggressive"; throws ConfigError otherwise.
SplitMethod parse_split_method(const std::string& name);

}  // namespace tefp

#endif  // TEFP_FINGERPRINT_CONFIG_H
