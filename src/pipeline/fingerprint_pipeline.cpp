#include "fingerprint_pipeline.h"

#include "bin_merger.h"
#include "cluster_buffer.h"
#include "split_cluster.h"
#include "task_queue.h"

#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace tefp {
namespace {

JoinConfig join_config(const FingerprintConfig& config) {
    JoinConfig join;
    join.join_distance = config.join_distance;
    join.n_common_elements = static_cast<size_t>(config.n_common_elements);
    return join;
}

bool locus_less(const JoinedLocus& a, const JoinedLocus& b) {
    return std::tie(a.locus.reference, a.locus.start, a.locus.stop, a.category) <
           std::tie(b.locus.reference, b.locus.start, b.locus.stop, b.category);
}

}  // namespace

FingerprintPipeline::FingerprintPipeline(FingerprintConfig config, const AnnotationIndex* annotations)
    : config_(std::move(config)),
      annotations_(annotations),
      joiner_(join_config(config_), annotations_) {
    validate_config(config_);
}

std::vector<Cluster> FingerprintPipeline::cluster_set(const CoordinateSet& coordinates) const {
    const auto minimum_points = static_cast<size_t>(config_.minimum_points);
    if (config_.method == SplitMethod::kNonHierarchical) {
        return cluster_coordinates(coordinates, config_.epsilon, minimum_points);
    }
    SplitClusterer splitter(config_.minimum_epsilon, config_.epsilon, minimum_points);
    return splitter.cluster(coordinates, config_.method);
}

ReferenceSummary FingerprintPipeline::process_reference(
    const std::string& reference,
    const std::vector<const TipTable::value_type*>& entries,
    const std::vector<std::string>& samples) const {
    ReferenceSummary summary;
    summary.reference = reference;

    // Clusters and buffered clusters point into these; sizes are fixed up front.
    std::vector<CoordinateSet> sets;
    sets.reserve(entries.size());
    for (const auto* entry : entries) {
        sets.emplace_back(entry->first, entry->second);
        summary.tips += static_cast<int64_t>(entry->second.size());
    }
    summary.coordinate_sets = static_cast<int64_t>(sets.size());

    std::vector<std::vector<Cluster>> clusters;
    clusters.reserve(sets.size());
    for (const auto& set : sets) {
        clusters.push_back(cluster_set(set));
        summary.clusters += static_cast<int64_t>(clusters.back().size());
    }

    std::vector<std::vector<BufferedCluster>> buffered;
    buffered.reserve(clusters.size());
    for (const auto& group : clusters) {
        buffered.push_back(buffer_all(group, config_.buffer_margin));
    }

    // Bins are compared per category, across samples and strands.
    std::map<std::string, std::vector<const BufferedCluster*>> by_category;
    for (const auto& group : buffered) {
        for (const auto& item : group) {
            by_category[item.key().category].push_back(&item);
        }
    }

    for (auto& [category, members] : by_category) {
        const auto bins = merge_bins(std::move(members), reference);
        summary.bins += static_cast<int64_t>(bins.size());
        // Flanks of an insertion may sit in neighbouring bins.
        for (auto& locus : joiner_.join(bins, samples)) {
            summary.loci.push_back(std::move(locus));
        }
    }

    std::sort(summary.loci.begin(), summary.loci.end(), locus_less);

    if (config_.verbose) {
        std::cerr << "[Pipeline] reference=" << reference
                  << " sets=" << summary.coordinate_sets
                  << " tips=" << summary.tips
                  << " clusters=" << summary.clusters
                  << " bins=" << summary.bins
                  << " loci=" << summary.loci.size() << '\n';
    }
    return summary;
}

FingerprintResult FingerprintPipeline::run(const TipTable& tips, std::vector<std::string> samples) const {
    std::map<std::string, std::vector<const TipTable::value_type*>> by_reference;
    std::set<std::string> table_samples;
    for (const auto& entry : tips) {
        by_reference[entry.first.reference].push_back(&entry);
        table_samples.insert(entry.first.sample);
    }
    for (const auto& sample : table_samples) {
        if (std::find(samples.begin(), samples.end(), sample) == samples.end()) {
            samples.push_back(sample);
        }
    }

    std::cerr << "[Pipeline] references=" << by_reference.size()
              << " samples=" << samples.size()
              << " threads=" << config_.threads
              << " method=" << split_method_name(config_.method) << '\n';

    TaskQueue queue(config_.threads);
    std::vector<std::future<ReferenceSummary>> futures;
    futures.reserve(by_reference.size());

    for (const auto& [reference, entries] : by_reference) {
        const auto* entries_ptr = &entries;
        const auto* samples_ptr = &samples;
        auto task = std::make_unique<PromiseTask<ReferenceSummary>>(
            reference,
            [this, reference = reference, entries_ptr, samples_ptr]() {
                return process_reference(reference, *entries_ptr, *samples_ptr);
            });
        futures.push_back(task->get_future());
        if (!queue.submit(std::move(task))) {
            throw std::runtime_error("task queue closed before reference " + reference);
        }
    }
    queue.close();

    FingerprintResult result;
    std::vector<JoinedLocus> loci;
    for (auto& future : futures) {
        ReferenceSummary summary = future.get();
        ++result.references;
        result.tips += summary.tips;
        result.clusters += summary.clusters;
        result.bins += summary.bins;
        for (auto& locus : summary.loci) {
            loci.push_back(std::move(locus));
        }
    }
    queue.wait();

    std::sort(loci.begin(), loci.end(), locus_less);
    std::cerr << "[Pipeline] tips=" << result.tips
              << " clusters=" << result.clusters
              << " bins=" << result.bins
              << " loci=" << loci.size() << '\n';

    OutputOptions options;
    options.n_common_elements = static_cast<size_t>(config_.n_common_elements);
    options.colour_by_proportion = config_.colour_by_proportion;
    result.model = ResultModel(std::move(loci), std::move(samples), options);
    return result;
}

}  // namespace tefp
