#pragma once

#include <vector>
#include <Eigen/Core>
#include <Eigen/Sparse>
#include "polygonMesh.h"
#include "segmentationParams.h"

namespace meshSegmentation
{
    using std::vector;
    using SparseMatrix = Eigen::SparseMatrix<Scalar>;
    using Triplet = Eigen::Triplet<Scalar>;
    using Vector3 = Eigen::Matrix<Scalar, 3, 1>;

    // one entry per edge shared by exactly two faces
    struct FacePair
    {
        size_t i, j;
        polygonMesh::EdgeKey edge;
    };

    struct FaceDistances
    {
        SparseMatrix matrix;
        vector<FacePair> pairs;

        vector<Scalar> geodesic;
        vector<Scalar> angular;
        vector<Scalar> geodesicNormalized;
        vector<Scalar> angularNormalized;

        size_t numBoundaryEdges = 0;
        size_t numNonManifoldEdges = 0;

        // connected components of the face graph
        size_t numComponents = 0;
        vector<size_t> elem2group;
    };

    Scalar geodesic_distance(const Vector3 &edge_v0, const Vector3 &edge_v1,
                             const Vector3 &center_i, const Vector3 &center_j);

    // 1 - cos(angle), scaled by eta when the fold between the faces is convex
    Scalar angular_distance(const Vector3 &normal_i, const Vector3 &normal_j,
                            const Vector3 &center_i, const Vector3 &center_j,
                            Scalar eta);

    FaceDistances build_face_distances(const polygonMesh::PolygonMesh &mesh,
                                       const SegmentationParams &params);
}
