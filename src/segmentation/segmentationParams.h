#pragma once

#include <cstdint>
#include <string>

namespace meshSegmentation
{
    using Scalar = double;

    enum class EigenSolver
    {
        Dense,
        Sparse
    };

    enum class KMeansInit
    {
        KMeansPlusPlus,
        Greedy
    };

    struct SegmentationParams
    {
        // blend of geodesic (1) against angular (0) distance
        Scalar delta = 0.5;
        // weight of convex folds, 0 = only concave folds count
        Scalar eta = 0.5;

        EigenSolver solver = EigenSolver::Dense;
        KMeansInit init = KMeansInit::Greedy;

        // seeds kmeans++ and the Lanczos start vector of the sparse eigensolver
        uint64_t seed = 0;
        size_t maxKMeansIterations = 50;

        // relative residual tolerance and restart budget of the sparse eigensolver
        Scalar eigenTolerance = 1e-10;
        size_t maxEigenIterations = 5000;

        bool verbose = false;
    };

    EigenSolver parse_eigen_solver(const std::string &name);
    KMeansInit parse_kmeans_init(const std::string &name);

    std::string to_string(EigenSolver solver);
    std::string to_string(KMeansInit init);
}
