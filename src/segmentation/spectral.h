#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include "affinity.h"

namespace meshSegmentation
{
    using VectorX = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

    struct EigenPairs
    {
        VectorX values;  // ascending
        MatrixX vectors; // one column per value
        size_t iterations = 0;
    };

    // D^-1/2 W D^-1/2 with D the row sums of W
    MatrixX normalized_laplacian(const MatrixX &W);

    // k eigenpairs of the largest eigenvalues of the symmetric matrix L
    EigenPairs top_eigenvectors_dense(const MatrixX &L, size_t k);
    EigenPairs top_eigenvectors_sparse(const MatrixX &L, size_t k, const SegmentationParams &params);
    EigenPairs top_eigenvectors(const MatrixX &L, size_t k, const SegmentationParams &params);

    // n x k embedding with unit length rows
    MatrixX spectral_embedding(const MatrixX &W, size_t k, const SegmentationParams &params);
}
