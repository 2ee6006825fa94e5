#pragma once

#include <random>
#include <vector>
#include <Eigen/Dense>
#include "segmentationParams.h"
#include "spectral.h"

namespace meshSegmentation
{
    using std::vector;

    struct KMeansResult
    {
        vector<size_t> labels;
        MatrixX centroids; // k x dim
        size_t iterations = 0;
        size_t numEmptyClusters = 0; // empty cluster events over all iterations
    };

    // Q = V V^T, cosine of the angle between two embedded faces
    MatrixX association_matrix(const MatrixX &V);

    // indices of the k starting centroids, least associated faces first
    vector<size_t> greedy_initial_guess(const MatrixX &Q, size_t k);

    // indices of the k starting centroids drawn by kmeans++ seeding
    vector<size_t> kmeanspp_initial_guess(const MatrixX &V, size_t k, std::mt19937_64 &rng);

    KMeansResult lloyd(const MatrixX &V, const MatrixX &centroids, size_t maxIterations);

    vector<size_t> cluster_embedding(const MatrixX &V, size_t k, const SegmentationParams &params);
}
