#include "faceDistance.h"
#include "segmentationError.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <tuple>

namespace meshSegmentation
{
    namespace
    {
        Vector3 vtx_point(const polygonMesh::PolygonMesh &mesh, size_t i_vtx)
        {
            return Vector3(mesh.vtx2xyz[i_vtx * 3 + 0],
                           mesh.vtx2xyz[i_vtx * 3 + 1],
                           mesh.vtx2xyz[i_vtx * 3 + 2]);
        }

        Scalar normalize_by_mean(const vector<Scalar> &values, vector<Scalar> &out, const char *name)
        {
            const Scalar mean = values.empty()
                                    ? Scalar(0)
                                    : std::accumulate(values.begin(), values.end(), Scalar(0)) / Scalar(values.size());
            if (!(mean > Scalar(0)) || !std::isfinite(mean))
            {
                throw NumericDomainError("distance", values.size(),
                                         std::string("mean ") + name + " distance over adjacent faces is zero, cannot normalize");
            }
            out.resize(values.size());
            for (size_t k = 0; k < values.size(); ++k)
                out[k] = values[k] / mean;
            return mean;
        }
    }

    Scalar geodesic_distance(const Vector3 &edge_v0, const Vector3 &edge_v1,
                             const Vector3 &center_i, const Vector3 &center_j)
    {
        const Vector3 mid = (edge_v0 + edge_v1) * Scalar(0.5);
        return (mid - center_i).norm() + (mid - center_j).norm();
    }

    Scalar angular_distance(const Vector3 &normal_i, const Vector3 &normal_j,
                            const Vector3 &center_i, const Vector3 &center_j,
                            Scalar eta)
    {
        const Scalar len = normal_i.norm() * normal_j.norm();
        if (!(len > Scalar(0)))
            throw NumericDomainError("distance", 3, "face normal has zero length");

        Scalar c = normal_i.dot(normal_j) / len;
        c = std::clamp(c, Scalar(-1), Scalar(1));
        Scalar dist = Scalar(1) - c;

        // centroid of j lies behind face i: convex fold
        if (normal_i.dot(center_j - center_i) < Scalar(0))
            dist *= eta;
        return dist;
    }

    FaceDistances build_face_distances(const polygonMesh::PolygonMesh &mesh,
                                       const SegmentationParams &params)
    {
        const size_t num_elem = mesh.num_elem();

        polygonMesh::Edge2Elem edge2elem =
            polygonMesh::edge2elem_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx);

        vector<Scalar> elem2cog = polygonMesh::elem2center_from_polygon_mesh_as_points(
            mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz, 3);

        auto center = [&](size_t i_elem)
        {
            return Vector3(elem2cog[i_elem * 3 + 0], elem2cog[i_elem * 3 + 1], elem2cog[i_elem * 3 + 2]);
        };
        auto normal = [&](size_t i_elem)
        {
            return Vector3(mesh.elem2nrm[i_elem * 3 + 0], mesh.elem2nrm[i_elem * 3 + 1], mesh.elem2nrm[i_elem * 3 + 2]);
        };

        FaceDistances out;
        for (const auto &[edge, elems] : edge2elem)
        {
            if (elems.size() == 2)
            {
                const size_t i = elems[0];
                const size_t j = elems[1];
                const Vector3 ci = center(i);
                const Vector3 cj = center(j);

                out.pairs.push_back({i, j, edge});
                out.geodesic.push_back(geodesic_distance(vtx_point(mesh, edge.v0), vtx_point(mesh, edge.v1), ci, cj));
                out.angular.push_back(angular_distance(normal(i), normal(j), ci, cj, params.eta));
            }
            else if (elems.size() > 2)
            {
                ++out.numNonManifoldEdges;
                std::cerr << "meshSegmentation: warning: edge (" << edge.v0 << "," << edge.v1
                          << ") has " << elems.size() << " adjacent faces [";
                for (size_t k = 0; k < elems.size(); ++k)
                    std::cerr << (k ? " " : "") << elems[k];
                std::cerr << "], excluded from distances" << std::endl;
            }
            else
            {
                ++out.numBoundaryEdges;
            }
        }

        normalize_by_mean(out.geodesic, out.geodesicNormalized, "geodesic");
        normalize_by_mean(out.angular, out.angularNormalized, "angular");

        const Scalar delta = params.delta;
        vector<Triplet> trips;
        trips.reserve(out.pairs.size() * 2);
        for (size_t k = 0; k < out.pairs.size(); ++k)
        {
            const Scalar w = delta * out.geodesicNormalized[k] + (Scalar(1) - delta) * out.angularNormalized[k];
            trips.emplace_back(out.pairs[k].i, out.pairs[k].j, w);
            trips.emplace_back(out.pairs[k].j, out.pairs[k].i, w);
        }

        out.matrix.resize(num_elem, num_elem);
        out.matrix.setFromTriplets(trips.begin(), trips.end());
        out.matrix.makeCompressed();

        auto elem2elem = polygonMesh::elem2elem_from_edge2elem(edge2elem, num_elem);
        const vector<size_t> &elem2jdx = elem2elem.first;
        const vector<size_t> &jdx2elem = elem2elem.second;
        std::tie(out.numComponents, out.elem2group) = polygonMesh::elem2group_from_polygon_mesh(
            elem2jdx,
            [&](size_t i_elem, size_t i_adj)
            { return jdx2elem[elem2jdx[i_elem] + i_adj]; });

        if (params.verbose)
        {
            std::cout << "meshSegmentation: " << out.numComponents << " connected components" << std::endl;
            std::cout << "meshSegmentation: " << out.pairs.size() << " adjacent face pairs, "
                      << out.numBoundaryEdges << " boundary edges, "
                      << out.numNonManifoldEdges << " non-manifold edges" << std::endl;
        }
        return out;
    }
}
