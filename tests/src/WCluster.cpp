#include <gtest/gtest.h>

#include "birch/WCluster.hpp"

#include <sstream>

TEST(WCluster, Basic) {
    birch::WCluster<int, double> cluster;
    EXPECT_EQ(cluster.size(), 0);
    EXPECT_EQ(cluster.name_automatic(), "Cluster");

    cluster.members = std::vector<int>{ 1, 5, 7 };
    cluster.name = "Foo";
    EXPECT_EQ(cluster.size(), 3);
    EXPECT_EQ(cluster.name_automatic(), "Foo");
}

TEST(WCluster, Text) {
    birch::ClusterModel<double> model;
    model.mean = std::vector<double>{ 1.5, -2 };
    model.variance = 0.25;
    birch::WCluster<int, double> cluster(std::nullopt, std::vector<int>{ 0, 2 }, model);

    std::stringstream out;
    birch::write_to_text(out, cluster);
    EXPECT_EQ(out.str(), "# Cluster name: Cluster\n# Cluster size: 2\n# Cluster Mean: 1.5 -2\n# Cluster Variance: 0.25\n");

    cluster.name = "Bar";
    std::stringstream out2;
    birch::write_to_text(out2, cluster, "## ");
    EXPECT_EQ(out2.str(), "## Cluster name: Bar\n## Cluster size: 2\n## Cluster Mean: 1.5 -2\n## Cluster Variance: 0.25\n");
}
