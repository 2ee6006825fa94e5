#pragma once

#include <vector>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <Eigen/Dense>
#include <array>
#include <earcut.hpp>

namespace util
{
    using std::vector, std::array;
    using Tri = std::array<size_t, 3>;
    template <typename Scalar>
    struct Math2
    {
        using Vector2 = Eigen::Matrix<Scalar, 2, 1>;
        using Vector3 = Eigen::Matrix<Scalar, 3, 1>;

        static Scalar signed_polygon_area(const vector<Vector2> &poly)
        {
            if (poly.size() < 3)
                return Scalar(0);
            Scalar s = Scalar(0);
            for (size_t i = 0; i < poly.size(); ++i)
            {
                size_t j = (i + 1) % poly.size();
                s += poly[i].x() * poly[j].y() - poly[j].x() * poly[i].y();
            }
            return Scalar(0.5) * s;
        }

        // 将Eigen点转成 earcut 所需格式
        static std::vector<std::vector<std::array<Scalar, 2>>> convert_to_earcut(const std::vector<Vector2> &polygon)
        {
            using Point = std::array<Scalar, 2>;
            using Ring = std::vector<Point>;

            Ring ring;
            ring.reserve(polygon.size());

            for (const auto &p : polygon)
            {
                ring.push_back({Scalar(p.x()), Scalar(p.y())});
            }

            std::vector<Ring> out;
            out.push_back(ring);
            return out;
        }

        // earcut on a single ring; indices refer to polygon2d
        static std::vector<Tri> triangulate_poly(const std::vector<Vector2> &polygon2d)
        {
            if (polygon2d.size() < 3)
                return {};

            auto polygon_earcut = convert_to_earcut(polygon2d);

            // earcut 返回的是索引序列，3个一组是三角形
            std::vector<uint32_t> indices = mapbox::earcut<uint32_t>(polygon_earcut);

            // keep the winding of the input ring
            const bool flip = signed_polygon_area(polygon2d) < Scalar(0);

            std::vector<Tri> triangles;
            for (size_t i = 0; i + 2 < indices.size(); i += 3)
            {
                if (flip)
                    triangles.push_back({indices[i], indices[i + 2], indices[i + 1]});
                else
                    triangles.push_back({indices[i], indices[i + 1], indices[i + 2]});
            }
            return triangles;
        }

        // Newell normal of a (possibly non-planar) loop, false when degenerate
        static bool compute_plane(const std::vector<Vector3> &pts, Vector3 &origin, Vector3 &normal, Scalar eps)
        {
            if (pts.size() < 3)
                return false;

            origin = Vector3::Zero();
            Vector3 n = Vector3::Zero();
            for (size_t i = 0; i < pts.size(); ++i)
            {
                const Vector3 &a = pts[i];
                const Vector3 &b = pts[(i + 1) % pts.size()];
                n.x() += (a.y() - b.y()) * (a.z() + b.z());
                n.y() += (a.z() - b.z()) * (a.x() + b.x());
                n.z() += (a.x() - b.x()) * (a.y() + b.y());
                origin += a;
            }
            origin /= Scalar(pts.size());

            if (n.norm() <= eps)
                return false; // 全共线

            normal = n.normalized();
            return true;
        }

        static void make_plane_basis(const Vector3 &n, Vector3 &u, Vector3 &v)
        {
            Vector3 tmp = (std::fabs(n.x()) < Scalar(0.9))
                              ? Vector3(1, 0, 0)
                              : Vector3(0, 1, 0);

            u = n.cross(tmp).normalized();
            v = u.cross(n);
        }

        static std::vector<Vector2> project_to_2d(
            const std::vector<Vector3> &pts,
            const Vector3 &origin,
            const Vector3 &u,
            const Vector3 &v)
        {
            std::vector<Vector2> out;
            out.reserve(pts.size());

            for (const auto &p : pts)
            {
                Vector3 d = p - origin;
                Vector2 p2d;
                p2d << d.dot(u), d.dot(v);
                out.push_back(p2d);
            }

            return out;
        }
    };
}
