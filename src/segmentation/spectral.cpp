#include "spectral.h"
#include "segmentationError.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <Spectra/SymEigsSolver.h>
#include <Spectra/MatOp/SparseSymMatProd.h>

#include "polygonMesh.h"

namespace meshSegmentation
{
    namespace
    {
        // connected components of the nonzero pattern of a symmetric sparse matrix
        size_t num_components(const SparseMatrix &A)
        {
            const size_t n = static_cast<size_t>(A.outerSize());
            std::vector<size_t> elem2jdx(A.outerIndexPtr(), A.outerIndexPtr() + n + 1);
            const int *jdx2elem = A.innerIndexPtr();
            auto adj = [&](size_t i_elem, size_t i_adj) -> size_t
            { return static_cast<size_t>(jdx2elem[elem2jdx[i_elem] + i_adj]); };
            return polygonMesh::elem2group_from_polygon_mesh(elem2jdx, adj).first;
        }
    }

    MatrixX normalized_laplacian(const MatrixX &W)
    {
        const VectorX degree = W.rowwise().sum();
        for (Eigen::Index i = 0; i < degree.size(); ++i)
        {
            if (!(degree[i] > Scalar(0)) || !std::isfinite(degree[i]))
                throw NumericDomainError("laplacian", static_cast<size_t>(i), "face has zero degree in the affinity graph");
        }

        // elementwise reciprocal square root applied to rows and columns
        const VectorX dsqrt = degree.array().rsqrt().matrix();
        return dsqrt.asDiagonal() * W * dsqrt.asDiagonal();
    }

    EigenPairs top_eigenvectors_dense(const MatrixX &L, size_t k)
    {
        const Eigen::Index n = L.rows();
        const Eigen::Index kk = static_cast<Eigen::Index>(k);

        Eigen::SelfAdjointEigenSolver<MatrixX> eig(L);
        if (eig.info() != Eigen::Success)
            throw NumericDomainError("eigensolver", static_cast<size_t>(n), "dense eigendecomposition failed");

        // 升序，最大的 k 个在最后
        EigenPairs out;
        out.values = eig.eigenvalues().tail(kk);
        out.vectors = eig.eigenvectors().rightCols(kk);
        out.iterations = 1;
        return out;
    }

    EigenPairs top_eigenvectors_sparse(const MatrixX &L, size_t k, const SegmentationParams &params)
    {
        const Eigen::Index n = L.rows();
        const Eigen::Index nev = static_cast<Eigen::Index>(k);
        const Eigen::Index ncv = std::max<Eigen::Index>(2 * nev + 1, 20);

        // Lanczos needs nev < ncv <= n, small problems go dense
        if (nev >= n || ncv > n)
            return top_eigenvectors_dense(L, k);

        // drop the zero affinities of disconnected pairs
        SparseMatrix Ls = L.sparseView();
        Ls.makeCompressed();

        // 多个连通分量时特征值 1 是重根，单向量 Krylov 空间只能找到其中一个
        if (num_components(Ls) > 1)
            return top_eigenvectors_dense(L, k);

        std::mt19937_64 rng(params.seed);
        std::normal_distribution<Scalar> gauss(Scalar(0), Scalar(1));
        VectorX resid(n);
        for (Eigen::Index i = 0; i < n; ++i)
            resid[i] = gauss(rng);

        using OpType = Spectra::SparseSymMatProd<Scalar>;
        OpType op(Ls);
        Spectra::SymEigsSolver<OpType> eigs(op, nev, ncv);
        eigs.init(resid.data());

        const Eigen::Index max_iter = static_cast<Eigen::Index>(std::max<size_t>(1, params.maxEigenIterations));
        const Eigen::Index nconv = eigs.compute(Spectra::SortRule::LargestAlge, max_iter, params.eigenTolerance);
        if (eigs.info() != Spectra::CompInfo::Successful || nconv < nev)
            throw NumericDomainError("eigensolver", k,
                                     "sparse eigensolver did not converge in " + std::to_string(max_iter) + " iterations");

        // Spectra sorts descending
        EigenPairs out;
        out.values = eigs.eigenvalues().reverse();
        out.vectors = eigs.eigenvectors().rowwise().reverse();
        out.iterations = static_cast<size_t>(eigs.num_iterations());
        return out;
    }

    EigenPairs top_eigenvectors(const MatrixX &L, size_t k, const SegmentationParams &params)
    {
        switch (params.solver)
        {
        case EigenSolver::Dense:
            return top_eigenvectors_dense(L, k);
        case EigenSolver::Sparse:
            return top_eigenvectors_sparse(L, k, params);
        }
        throw InputError("unknown eigensolver");
    }

    MatrixX spectral_embedding(const MatrixX &W, size_t k, const SegmentationParams &params)
    {
        if (params.verbose)
            std::cout << "meshSegmentation: Calculating graph laplacian..." << std::endl;
        const MatrixX L = normalized_laplacian(W);

        if (params.verbose)
            std::cout << "meshSegmentation: Calculating eigenvectors (" << to_string(params.solver) << ")..." << std::endl;
        EigenPairs eig = top_eigenvectors(L, k, params);
        if (params.verbose && params.solver == EigenSolver::Sparse)
            std::cout << "meshSegmentation: eigensolver converged after " << eig.iterations << " iterations" << std::endl;

        // normalize each row to unit length
        MatrixX V = std::move(eig.vectors);
        for (Eigen::Index i = 0; i < V.rows(); ++i)
        {
            const Scalar len = V.row(i).norm();
            if (!(len > Scalar(0)) || !std::isfinite(len))
                throw NumericDomainError("embedding", static_cast<size_t>(i), "embedded face row has zero norm");
            V.row(i) /= len;
        }
        return V;
    }
}
