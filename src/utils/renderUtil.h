#pragma once

#include <raylib.h>
#include <vector>

namespace renderUtil{

    Color cluster_color_from_id(const size_t cluster_id, const size_t num_cluster);

    std::vector<Color> cluster2colors(const size_t num_cluster);

    // color of every face from its cluster label
    std::vector<Color> elem2colors(const std::vector<size_t> &elem2cluster, const size_t num_cluster);
}
