#include "meshSegmentation.h"
#include "faceDistance.h"
#include "affinity.h"
#include "spectral.h"
#include "kmeans.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace meshSegmentation
{
    namespace
    {
        std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool in_unit_interval(Scalar v)
        {
            return std::isfinite(v) && v >= Scalar(0) && v <= Scalar(1);
        }
    }

    EigenSolver parse_eigen_solver(const std::string &name)
    {
        const std::string s = to_lower(name);
        if (s == "dense")
            return EigenSolver::Dense;
        if (s == "sparse")
            return EigenSolver::Sparse;
        throw InputError("unknown eigensolver '" + name + "', expected dense or sparse");
    }

    KMeansInit parse_kmeans_init(const std::string &name)
    {
        const std::string s = to_lower(name);
        if (s == "kmeans++" || s == "++")
            return KMeansInit::KMeansPlusPlus;
        if (s == "greedy")
            return KMeansInit::Greedy;
        throw InputError("unknown k-means initialization '" + name + "', expected kmeans++ or greedy");
    }

    std::string to_string(EigenSolver solver)
    {
        return solver == EigenSolver::Dense ? "dense" : "sparse";
    }

    std::string to_string(KMeansInit init)
    {
        return init == KMeansInit::Greedy ? "greedy" : "kmeans++";
    }

    void validate_input(const polygonMesh::PolygonMesh &mesh, size_t k, const SegmentationParams &params)
    {
        const size_t num_elem = mesh.num_elem();
        if (num_elem == 0)
            throw InputError("mesh has no faces");
        if (k < 2 || k > num_elem)
            throw InputError("k = " + std::to_string(k) + " must lie in [2, " + std::to_string(num_elem) + "]");
        if (!in_unit_interval(params.delta))
            throw InputError("delta = " + std::to_string(params.delta) + " must lie in [0, 1]");
        if (!in_unit_interval(params.eta))
            throw InputError("eta = " + std::to_string(params.eta) + " must lie in [0, 1]");
        if (params.maxKMeansIterations < 1)
            throw InputError("maxKMeansIterations must be at least 1");

        if (mesh.elem2idx.front() != 0 || mesh.elem2idx.back() != mesh.idx2vtx.size())
            throw InputError("elem2idx does not span idx2vtx");
        for (size_t i_elem = 0; i_elem < num_elem; ++i_elem)
        {
            if (mesh.elem2idx[i_elem + 1] < mesh.elem2idx[i_elem] + 3)
                throw InputError("face " + std::to_string(i_elem) + " has fewer than 3 corners");
        }
        if (mesh.vtx2xyz.size() % 3 != 0)
            throw InputError("vtx2xyz is not a list of 3d points");
        const size_t num_vtx = mesh.num_vtx();
        for (size_t i_vtx : mesh.idx2vtx)
        {
            if (i_vtx >= num_vtx)
                throw InputError("vertex index " + std::to_string(i_vtx) + " out of range");
        }
        if (mesh.elem2nrm.size() != num_elem * 3)
            throw InputError("expected one normal per face");
    }

    std::vector<size_t> segment(const polygonMesh::PolygonMesh &mesh, size_t k,
                                const SegmentationParams &params,
                                const ResultCallback &onResult)
    {
        validate_input(mesh, k, params);

        if (params.verbose)
            std::cout << "meshSegmentation: Calculating face distance matrix..." << std::endl;
        const FaceDistances distances = build_face_distances(mesh, params);

        const AffinityResult affinity = build_affinity_matrix(distances.matrix, params);

        if (params.verbose)
            std::cout << "meshSegmentation: Spectral embedding of " << mesh.num_elem() << " faces..." << std::endl;
        const MatrixX V = spectral_embedding(affinity.matrix, k, params);

        std::vector<size_t> labels = cluster_embedding(V, k, params);

        if (params.verbose)
            std::cout << "meshSegmentation: Done." << std::endl;

        if (onResult)
            onResult(mesh, k, labels);
        return labels;
    }
}
