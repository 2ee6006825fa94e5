#include "affinity.h"
#include "segmentationError.h"

#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <queue>
#include <utility>

namespace meshSegmentation
{
    MatrixX all_pairs_shortest_paths(const SparseMatrix &distances)
    {
        const Eigen::Index n = distances.rows();
        assert(distances.cols() == n);

        // row major copy so that out-edges of a face are contiguous
        Eigen::SparseMatrix<Scalar, Eigen::RowMajor> graph = distances;
        graph.makeCompressed();

        const Scalar inf = std::numeric_limits<Scalar>::infinity();
        MatrixX W = MatrixX::Constant(n, n, inf);

        using PQEntry = std::pair<Scalar, Eigen::Index>;

        // every source is independent, rows of W are disjoint
#pragma omp parallel for schedule(dynamic, 16)
        for (Eigen::Index src = 0; src < n; ++src)
        {
            std::vector<Scalar> dist(n, inf);
            std::vector<char> visited(n, 0);
            std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>> pq;

            dist[src] = Scalar(0);
            pq.emplace(Scalar(0), src);

            while (!pq.empty())
            {
                auto [d, u] = pq.top();
                pq.pop();

                if (visited[u])
                    continue;
                visited[u] = 1;

                for (Eigen::SparseMatrix<Scalar, Eigen::RowMajor>::InnerIterator it(graph, u); it; ++it)
                {
                    const Eigen::Index v = it.col();
                    if (visited[v])
                        continue;
                    const Scalar new_dist = d + it.value();
                    if (new_dist < dist[v])
                    {
                        dist[v] = new_dist;
                        pq.emplace(new_dist, v);
                    }
                }
            }

            for (Eigen::Index j = 0; j < n; ++j)
                W(src, j) = dist[j];
        }

        return W;
    }

    AffinityResult build_affinity_matrix(const SparseMatrix &distances,
                                         const SegmentationParams &params)
    {
        const Eigen::Index n = distances.rows();
        if (params.verbose)
            std::cout << "meshSegmentation: Finding shortest paths between all faces..." << std::endl;

        MatrixX W = all_pairs_shortest_paths(distances);

        AffinityResult out;
        Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic> unreachable(n, n);
        for (Eigen::Index j = 0; j < n; ++j)
        {
            for (Eigen::Index i = 0; i < n; ++i)
            {
                unreachable(i, j) = std::isinf(W(i, j));
                if (unreachable(i, j))
                    W(i, j) = Scalar(0);
            }
        }
        out.numUnreachablePairs = static_cast<size_t>(unreachable.count());

        if (params.verbose)
            std::cout << "meshSegmentation: Creating affinity matrix..." << std::endl;

        const Scalar sigma = W.sum() / Scalar(n * n);
        if (!(sigma > Scalar(0)) || !std::isfinite(sigma))
        {
            throw NumericDomainError("affinity", static_cast<size_t>(n),
                                     "mean shortest path length (sigma) is zero");
        }
        out.sigma = sigma;

        // change distances to similarities
        const Scalar den = Scalar(2) * sigma * sigma;
        W = (-W.array() / den).exp().matrix();
        for (Eigen::Index j = 0; j < n; ++j)
        {
            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (unreachable(i, j))
                    W(i, j) = Scalar(0);
            }
        }
        W.diagonal().setOnes();

        if (params.verbose && out.numUnreachablePairs > 0)
        {
            std::cout << "meshSegmentation: " << out.numUnreachablePairs
                      << " face pairs are not connected, their affinity is 0" << std::endl;
        }

        out.matrix = std::move(W);
        return out;
    }
}
