#ifndef BIRCH_WCLUSTER_HPP
#define BIRCH_WCLUSTER_HPP

#include <vector>
#include <string>
#include <optional>
#include <ostream>
#include <cstddef>
#include <utility>

/**
 * @file WCluster.hpp
 * @brief Clusters reported by weighted k-means.
 */

namespace birch {

/**
 * @brief Model of a k-means cluster.
 *
 * @tparam Float_ Floating-point type of the statistics.
 */
template<typename Float_>
struct ClusterModel {
    /**
     * Mean vector of the cluster, of length equal to the number of dimensions.
     */
    std::vector<Float_> mean;

    /**
     * Mean squared distance of the cluster's observations to the mean.
     */
    Float_ variance = 0;
};

/**
 * @brief A cluster from the weighted k-means algorithm.
 *
 * @tparam Id_ Integer type of the member identifiers.
 * @tparam Float_ Floating-point type of the model statistics.
 */
template<typename Id_, typename Float_>
struct WCluster {
    /**
     * @cond
     */
    WCluster() = default;

    WCluster(std::optional<std::string> name, std::vector<Id_> members, ClusterModel<Float_> model) :
        name(std::move(name)), members(std::move(members)), model(std::move(model)) {}
    /**
     * @endcond
     */

    /**
     * Name of the cluster, if any.
     */
    std::optional<std::string> name;

    /**
     * Identifiers of the members, in increasing order.
     * For the leaf-level clusters, these are indices of the pseudo-points;
     * for the final clusters, these are indices of the original observations.
     */
    std::vector<Id_> members;

    /**
     * Model of the cluster.
     */
    ClusterModel<Float_> model;

    /**
     * @return Number of members.
     */
    std::size_t size() const {
        return members.size();
    }

    /**
     * @return Name of the cluster, or `"Cluster"` if no name was assigned.
     */
    std::string name_automatic() const {
        if (name.has_value()) {
            return *name;
        }
        return "Cluster";
    }
};

/**
 * Write the metadata of a cluster as comment lines, i.e., the name, size and model.
 * The members themselves are not written and should be handled by the caller.
 *
 * @tparam Id_ Integer type of the member identifiers.
 * @tparam Float_ Floating-point type of the model statistics.
 *
 * @param out Output stream.
 * @param cluster Cluster to be written.
 * @param prefix Prefix for each line.
 */
template<typename Id_, typename Float_>
void write_to_text(std::ostream& out, const WCluster<Id_, Float_>& cluster, const std::string& prefix = "# ") {
    out << prefix << "Cluster name: " << cluster.name_automatic() << "\n";
    out << prefix << "Cluster size: " << cluster.size() << "\n";
    out << prefix << "Cluster Mean:";
    for (auto m : cluster.model.mean) {
        out << " " << m;
    }
    out << "\n";
    out << prefix << "Cluster Variance: " << cluster.model.variance << "\n";
}

}

#endif
