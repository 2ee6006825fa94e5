#include "kmeans.h"
#include "segmentationError.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>
#include <numeric>

namespace meshSegmentation
{
    namespace
    {
        MatrixX rows_of(const MatrixX &V, const vector<size_t> &ids)
        {
            MatrixX out(static_cast<Eigen::Index>(ids.size()), V.cols());
            for (size_t c = 0; c < ids.size(); ++c)
                out.row(static_cast<Eigen::Index>(c)) = V.row(static_cast<Eigen::Index>(ids[c]));
            return out;
        }

        // nearest centroid by squared distance, lowest label on ties
        size_t nearest_centroid(const MatrixX &V, Eigen::Index i, const MatrixX &centroids)
        {
            size_t best = 0;
            Scalar best_dist = std::numeric_limits<Scalar>::infinity();
            for (Eigen::Index c = 0; c < centroids.rows(); ++c)
            {
                const Scalar d = (V.row(i) - centroids.row(c)).squaredNorm();
                if (d < best_dist)
                {
                    best_dist = d;
                    best = static_cast<size_t>(c);
                }
            }
            return best;
        }
    }

    MatrixX association_matrix(const MatrixX &V)
    {
        return V * V.transpose();
    }

    vector<size_t> greedy_initial_guess(const MatrixX &Q, size_t k)
    {
        const size_t n = static_cast<size_t>(Q.rows());
        assert(Q.cols() == Q.rows());
        assert(k >= 2 && k <= n);

        // 关联度最小的一对
        size_t first = 0, second = 1;
        Scalar min_q = std::numeric_limits<Scalar>::infinity();
        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = 0; j < n; ++j)
            {
                if (i == j)
                    continue;
                if (Q(i, j) < min_q)
                {
                    min_q = Q(i, j);
                    first = i;
                    second = j;
                }
            }
        }

        vector<size_t> ids{first, second};
        vector<char> chosen(n, 0);
        chosen[first] = 1;
        chosen[second] = 1;

        // max association to the chosen set, updated incrementally
        vector<Scalar> max_q(n);
        for (size_t m = 0; m < n; ++m)
            max_q[m] = std::max(Q(first, m), Q(second, m));

        for (size_t round = 2; round < k; ++round)
        {
            size_t best = n;
            for (size_t m = 0; m < n; ++m)
            {
                if (chosen[m])
                    continue;
                if (best == n || max_q[m] < max_q[best])
                    best = m;
            }
            assert(best < n);

            ids.push_back(best);
            chosen[best] = 1;
            for (size_t m = 0; m < n; ++m)
                max_q[m] = std::max(max_q[m], Q(best, m));
        }
        return ids;
    }

    vector<size_t> kmeanspp_initial_guess(const MatrixX &V, size_t k, std::mt19937_64 &rng)
    {
        const size_t n = static_cast<size_t>(V.rows());
        assert(k >= 1 && k <= n);

        std::uniform_int_distribution<size_t> pick(0, n - 1);
        std::uniform_real_distribution<Scalar> uniform_dist(0.0, 1.0);

        vector<size_t> ids{pick(rng)};
        vector<Scalar> min_dist(n);
        for (size_t i = 0; i < n; ++i)
            min_dist[i] = (V.row(i) - V.row(ids[0])).squaredNorm();

        vector<Scalar> cumsum(n);
        while (ids.size() < k)
        {
            std::partial_sum(min_dist.begin(), min_dist.end(), cumsum.begin());
            const Scalar total = cumsum.back();

            size_t next;
            if (total > Scalar(0))
            {
                // 按距离平方的累计分布采样
                const Scalar target = uniform_dist(rng) * total;
                auto it = std::lower_bound(cumsum.begin(), cumsum.end(), target);
                next = std::min<size_t>(static_cast<size_t>(std::distance(cumsum.begin(), it)), n - 1);
                // lower_bound can land on a zero-weight entry when target is 0
                while (min_dist[next] <= Scalar(0) && next + 1 < n)
                    ++next;
            }
            else
            {
                // every point sits on a chosen center
                next = pick(rng);
            }

            ids.push_back(next);
            for (size_t i = 0; i < n; ++i)
                min_dist[i] = std::min(min_dist[i], (V.row(i) - V.row(next)).squaredNorm());
        }
        return ids;
    }

    KMeansResult lloyd(const MatrixX &V, const MatrixX &centroids, size_t maxIterations)
    {
        const Eigen::Index n = V.rows();
        const Eigen::Index k = centroids.rows();

        KMeansResult out;
        out.centroids = centroids;
        out.labels.assign(static_cast<size_t>(n), 0);

        vector<size_t> prev;
        for (size_t iter = 0; iter < maxIterations; ++iter)
        {
            for (Eigen::Index i = 0; i < n; ++i)
                out.labels[i] = nearest_centroid(V, i, out.centroids);
            out.iterations = iter + 1;

            if (out.labels == prev)
                break;
            prev = out.labels;

            MatrixX sum = MatrixX::Zero(k, V.cols());
            vector<size_t> count(static_cast<size_t>(k), 0);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                sum.row(static_cast<Eigen::Index>(out.labels[i])) += V.row(i);
                ++count[out.labels[i]];
            }

            for (Eigen::Index c = 0; c < k; ++c)
            {
                if (count[c] == 0)
                {
                    // keep the previous centroid
                    ++out.numEmptyClusters;
                    std::cerr << "meshSegmentation: warning: cluster " << c
                              << " is empty in k-means iteration " << iter << std::endl;
                    continue;
                }
                out.centroids.row(c) = sum.row(c) / Scalar(count[c]);
            }
        }
        return out;
    }

    vector<size_t> cluster_embedding(const MatrixX &V, size_t k, const SegmentationParams &params)
    {
        vector<size_t> ids;
        switch (params.init)
        {
        case KMeansInit::Greedy:
        {
            if (params.verbose)
                std::cout << "meshSegmentation: Preparing kmeans..." << std::endl;
            ids = greedy_initial_guess(association_matrix(V), k);
            break;
        }
        case KMeansInit::KMeansPlusPlus:
        {
            std::mt19937_64 rng(params.seed);
            ids = kmeanspp_initial_guess(V, k, rng);
            break;
        }
        default:
            throw InputError("unknown k-means initialization");
        }

        if (params.verbose)
            std::cout << "meshSegmentation: Applying kmeans..." << std::endl;
        KMeansResult result = lloyd(V, rows_of(V, ids), params.maxKMeansIterations);
        if (params.verbose)
        {
            std::cout << "meshSegmentation: kmeans stopped after " << result.iterations << " iterations";
            if (result.numEmptyClusters > 0)
                std::cout << " (" << result.numEmptyClusters << " empty cluster events)";
            std::cout << std::endl;
        }
        return std::move(result.labels);
    }
}
