#ifndef TEFP_CLUSTER_BUFFER_H
#define TEFP_CLUSTER_BUFFER_H

#include "density_cluster.h"

#include <cstdint>
#include <vector>

namespace tefp {

/**
 * BufferedCluster: a cluster with its comparison extent.
 * The extent only decides bin membership; reported coordinates come from trim().
 */
struct BufferedCluster {
    const Cluster* cluster = nullptr;
    Locus extent;

    const CoordinateKey& key() const { return cluster->key(); }
};

// [first - margin, last + margin], start clamped at 0. Membership is unchanged.
Locus buffer(const Cluster& cluster, int64_t margin);

// [first member position, last member position].
Locus trim(const Cluster& cluster);

std::vector<BufferedCluster> buffer_all(const std::vector<Cluster>& clusters, int64_t margin);

}  // namespace tefp

#endif  // TEFP_CLUSTER_BUFFER_H
