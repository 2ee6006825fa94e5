#include "renderUtil.h"
#include "objIO.h"

namespace renderUtil{

    Color cluster_color_from_id(size_t cluster_id, size_t num_cluster)
    {
        if (cluster_id >= num_cluster)
            return BLACK;
        // same palette as the exported .mtl
        std::array<float, 3> rgb = objIO::segment_rgb_from_id(cluster_id, num_cluster);
        return Color{(unsigned char)(rgb[0] * 255), (unsigned char)(rgb[1] * 255), (unsigned char)(rgb[2] * 255), 255};
    }

    std::vector<Color> cluster2colors(const size_t num_cluster){
        std::vector<Color> cluster2colors;
        for(size_t i = 0; i < num_cluster; i++){
            cluster2colors.push_back(cluster_color_from_id(i, num_cluster));
        }
        return cluster2colors;
    }

    std::vector<Color> elem2colors(const std::vector<size_t> &elem2cluster, const size_t num_cluster)
    {
        std::vector<Color> palette = cluster2colors(num_cluster);
        std::vector<Color> out;
        out.reserve(elem2cluster.size());
        for (size_t c : elem2cluster)
            out.push_back(c < num_cluster ? palette[c] : BLACK);
        return out;
    }
}
