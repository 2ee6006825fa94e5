#pragma once

#include <Eigen/Dense>
#include "faceDistance.h"

namespace meshSegmentation
{
    using MatrixX = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

    struct AffinityResult
    {
        MatrixX matrix;
        Scalar sigma = 0;
        size_t numUnreachablePairs = 0;
    };

    // dense n x n shortest weighted path lengths, +inf where no path exists
    MatrixX all_pairs_shortest_paths(const SparseMatrix &distances);

    // Gaussian kernel over the path lengths, unreachable pairs 0, diagonal 1
    AffinityResult build_affinity_matrix(const SparseMatrix &distances,
                                         const SegmentationParams &params);
}
