#include "cluster_buffer.h"

#include <algorithm>
#include <stdexcept>

namespace tefp {

Locus buffer(const Cluster& cluster, int64_t margin) {
    if (margin < 0) {
        throw std::invalid_argument("buffer margin must be >= 0");
    }
    Locus extent = trim(cluster);
    extent.start = std::max<int64_t>(0, extent.start - margin);
    extent.stop += margin;
    return extent;
}

Locus trim(const Cluster& cluster) {
    return Locus{cluster.key().reference, cluster.first_position(), cluster.last_position()};
}

std::vector<BufferedCluster> buffer_all(const std::vector<Cluster>& clusters, int64_t margin) {
    std::vector<BufferedCluster> buffered;
    buffered.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        buffered.push_back({&cluster, buffer(cluster, margin)});
    }
    return buffered;
}

}  // namespace tefp
