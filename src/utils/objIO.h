#pragma once

#include <array>
#include <iosfwd>
#include <string>
#include <vector>
#include "polygonMesh.h"

namespace objIO
{
    // v and f records only; polygons of any size, "i", "i/t", "i//n", "i/t/n"
    // tokens and negative indices. Face normals are recomputed (Newell).
    // throws std::runtime_error when the file cannot be read or parsed
    polygonMesh::PolygonMesh load_obj_polygon_mesh(const std::string &path);

    polygonMesh::PolygonMesh parse_obj_polygon_mesh(std::istream &in, const std::string &name = "<stream>");

    // rgb in [0,1], hues spread evenly over the segments
    std::array<float, 3> segment_rgb_from_id(size_t segment_id, size_t num_segment);

    // one "g segment_<c>" group per label with a material of the same name,
    // materials go to the .mtl file beside path
    void save_obj_segments(const std::string &path,
                           const polygonMesh::PolygonMesh &mesh,
                           const std::vector<size_t> &labels,
                           size_t num_segment);
}
