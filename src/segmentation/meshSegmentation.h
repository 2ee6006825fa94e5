#pragma once

#include <functional>
#include <vector>
#include "polygonMesh.h"
#include "segmentationParams.h"
#include "segmentationError.h"

namespace meshSegmentation
{
    // receives the mesh, the cluster count and one label per face
    using ResultCallback = std::function<void(const polygonMesh::PolygonMesh &, size_t, const std::vector<size_t> &)>;

    // throws InputError when the mesh or the parameters cannot be segmented
    void validate_input(const polygonMesh::PolygonMesh &mesh, size_t k, const SegmentationParams &params);

    /**
     * Segments the faces of a polygon mesh into k clusters by spectral clustering
     * of the face dual graph.
     *
     * @param mesh polygon mesh with one normal per face
     * @param k number of segments, 2 <= k <= number of faces
     * @param params distance blending, solver and k-means settings
     * @param onResult called once with the labels when every stage succeeded
     * @return label in [0, k) for every face
     */
    std::vector<size_t> segment(const polygonMesh::PolygonMesh &mesh, size_t k,
                                const SegmentationParams &params,
                                const ResultCallback &onResult = {});
}
