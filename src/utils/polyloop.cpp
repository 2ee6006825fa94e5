#include "polyloop.h"

namespace polyloop
{
    Polyloop3::Polyloop3(const std::vector<Vector3> &points)
        : points_(points)
    {
        // 1. 计算平面（origin 和 normal）
        if (!M2::compute_plane(points_, origin_, normal_, 1e-7f))
            return;

        // 2. 计算平面基 u,v
        M2::make_plane_basis(normal_, u_, v_);

        // 3. 投影到二维平面
        projected_points_ = M2::project_to_2d(points_, origin_, u_, v_);

        // 4. 三角化二维投影多边形
        triangles_ = M2::triangulate_poly(projected_points_);
    }
}
