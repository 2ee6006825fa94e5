#pragma once

#include <vector>
#include "util.h"
#include "polygonMesh.h"

namespace polyloop
{

    using Scalar = float;
    using M2 = util::Math2<Scalar>;
    using Vector2 = typename M2::Vector2;
    using Vector3 = typename M2::Vector3;
    using Tri = util::Tri;

    // planar polygon in 3d, triangulated in its own plane
    class Polyloop3
    {
    public:
        Polyloop3(const std::vector<Vector3> &points);

        const std::vector<Vector3> &points() const { return points_; }
        const std::vector<Vector2> &projected_points() const { return projected_points_; }
        const std::vector<Tri> &triangles() const { return triangles_; }
        const Vector3 &normal() const { return normal_; }

    private:
        std::vector<Vector3> points_;
        Vector3 origin_, normal_, u_, v_;
        std::vector<Vector2> projected_points_;
        std::vector<Tri> triangles_;
    };

    // one loop per face of the mesh
    inline std::vector<Polyloop3> polyloops_from_polygon_mesh(const polygonMesh::PolygonMesh &mesh)
    {
        std::vector<Polyloop3> out;
        out.reserve(mesh.num_elem());
        for (size_t i_elem = 0; i_elem < mesh.num_elem(); ++i_elem)
        {
            std::vector<Vector3> points;
            for (size_t k = mesh.elem2idx[i_elem]; k < mesh.elem2idx[i_elem + 1]; ++k)
            {
                const size_t i_vtx = mesh.idx2vtx[k];
                points.push_back({Scalar(mesh.vtx2xyz[i_vtx * 3 + 0]),
                                  Scalar(mesh.vtx2xyz[i_vtx * 3 + 1]),
                                  Scalar(mesh.vtx2xyz[i_vtx * 3 + 2])});
            }
            out.emplace_back(points);
        }
        return out;
    }
}
