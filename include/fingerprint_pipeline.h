#ifndef TEFP_FINGERPRINT_PIPELINE_H
#define TEFP_FINGERPRINT_PIPELINE_H

#include "annotation_reader.h"
#include "coordinate_set.h"
#include "density_cluster.h"
#include "fingerprint_config.h"
#include "pair_joiner.h"
#include "result_model.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tefp {

/**
 * ReferenceSummary: everything one reference task produced.
 * Loci own their data; clusters and bins die with the task.
 */
struct ReferenceSummary {
    std::string reference;
    int64_t coordinate_sets = 0;
    int64_t tips = 0;
    int64_t clusters = 0;
    int64_t bins = 0;
    std::vector<JoinedLocus> loci;
};

struct FingerprintResult {
    int64_t references = 0;
    int64_t tips = 0;
    int64_t clusters = 0;
    int64_t bins = 0;
    ResultModel model;
};

/**
 * FingerprintPipeline: cluster, compare and join read tips of all samples.
 *
 * One task per reference runs on a TaskQueue of config.threads workers.
 * Results are merged in reference order and sorted by
 * (reference, start, stop, category). The first task failure is rethrown
 * and no result is produced.
 */
class FingerprintPipeline {
public:
    // Throws ConfigError if the configuration is invalid.
    explicit FingerprintPipeline(FingerprintConfig config, const AnnotationIndex* annotations = nullptr);

    /**
     * Run over an extracted tip table. samples fixes the output column
     * order; samples present only in the table are appended in name order.
     */
    FingerprintResult run(const TipTable& tips, std::vector<std::string> samples = {}) const;

    ReferenceSummary process_reference(
        const std::string& reference,
        const std::vector<const TipTable::value_type*>& entries,
        const std::vector<std::string>& samples) const;

    // Clusters of one coordinate set with the configured method.
    std::vector<Cluster> cluster_set(const CoordinateSet& coordinates) const;

    const FingerprintConfig& config() const { return config_; }

private:
    FingerprintConfig config_;
    const AnnotationIndex* annotations_;
    PairJoiner joiner_;
};

}  // namespace tefp

#endif  // TEFP_FINGERPRINT_PIPELINE_H
