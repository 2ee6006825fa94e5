#pragma once

// Shared polygon meshes for the segmentation test suites.
// All functions are inline so every test file can include this header.

#include <cmath>
#include <initializer_list>
#include <vector>
#include "polygonMesh.h"

inline polygonMesh::PolygonMesh MakePolygonMesh(
    const std::vector<double> &vtx2xyz,
    std::initializer_list<std::vector<size_t>> faces)
{
    polygonMesh::PolygonMesh mesh;
    mesh.vtx2xyz = vtx2xyz;
    for (const auto &face : faces)
    {
        mesh.idx2vtx.insert(mesh.idx2vtx.end(), face.begin(), face.end());
        mesh.elem2idx.push_back(mesh.idx2vtx.size());
    }
    mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
    return mesh;
}

inline void AppendFace(polygonMesh::PolygonMesh &mesh, const std::vector<size_t> &face)
{
    mesh.idx2vtx.insert(mesh.idx2vtx.end(), face.begin(), face.end());
    mesh.elem2idx.push_back(mesh.idx2vtx.size());
}

// Axis aligned cube [o, o+1]^3 with outward quads, 8 vertices, 6 faces.
//   Face 0: bottom (-z)  Face 1: top (+z)
//   Face 2: front  (-y)  Face 3: back (+y)
//   Face 4: left   (-x)  Face 5: right (+x)
// Opposite faces are (0,1), (2,3), (4,5); every other pair shares an edge.
inline polygonMesh::PolygonMesh MakeUnitCube(double ox = 0.0, double oy = 0.0, double oz = 0.0)
{
    return MakePolygonMesh(
        {ox + 0, oy + 0, oz + 0,
         ox + 1, oy + 0, oz + 0,
         ox + 1, oy + 1, oz + 0,
         ox + 0, oy + 1, oz + 0,
         ox + 0, oy + 0, oz + 1,
         ox + 1, oy + 0, oz + 1,
         ox + 1, oy + 1, oz + 1,
         ox + 0, oy + 1, oz + 1},
        {{0, 3, 2, 1},
         {4, 5, 6, 7},
         {0, 1, 5, 4},
         {2, 3, 7, 6},
         {0, 4, 7, 3},
         {1, 2, 6, 5}});
}

// Appends the faces and vertices of b to mesh, renumbering b's vertices.
inline void AppendMesh(polygonMesh::PolygonMesh &mesh, const polygonMesh::PolygonMesh &b)
{
    const size_t offset = mesh.num_vtx();
    mesh.vtx2xyz.insert(mesh.vtx2xyz.end(), b.vtx2xyz.begin(), b.vtx2xyz.end());
    for (size_t i_elem = 0; i_elem < b.num_elem(); ++i_elem)
    {
        std::vector<size_t> face;
        for (size_t k = b.elem2idx[i_elem]; k < b.elem2idx[i_elem + 1]; ++k)
            face.push_back(b.idx2vtx[k] + offset);
        AppendFace(mesh, face);
    }
    mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
}

// Two unit cubes that share no vertex: faces 0..5 and 6..11.
inline polygonMesh::PolygonMesh MakeTwoCubes()
{
    polygonMesh::PolygonMesh mesh = MakeUnitCube();
    AppendMesh(mesh, MakeUnitCube(3.0, 0.0, 0.0));
    return mesh;
}

// UV sphere of radius 1 centered at (ox,0,0), num_u slices and num_v stacks,
// num_u*num_v outward faces: a triangle fan at each pole, quads in between.
// jitter > 0 scales every vertex radius by a fixed pseudo random factor in
// [1-jitter, 1+jitter], which breaks the rotational symmetry of the spectrum.
inline polygonMesh::PolygonMesh MakeUVSphere(size_t num_u, size_t num_v, double jitter = 0.0, double ox = 0.0)
{
    const double pi = 3.14159265358979323846;
    polygonMesh::PolygonMesh mesh;
    auto push = [&](double theta, double phi)
    {
        const size_t i_vtx = mesh.num_vtx();
        const double r = 1.0 + jitter * (double((i_vtx * 7919) % 13) / 6.0 - 1.0);
        mesh.vtx2xyz.insert(mesh.vtx2xyz.end(),
                            {ox + r * std::sin(theta) * std::cos(phi),
                             r * std::sin(theta) * std::sin(phi),
                             r * std::cos(theta)});
    };

    // vertex 0 north pole, rings 1..num_v-1, last vertex south pole
    push(0.0, 0.0);
    for (size_t i_ring = 1; i_ring < num_v; ++i_ring)
        for (size_t j = 0; j < num_u; ++j)
            push(pi * double(i_ring) / double(num_v), 2.0 * pi * double(j) / double(num_u));
    push(pi, 0.0);

    const size_t south = mesh.num_vtx() - 1;
    auto ring = [&](size_t i_ring, size_t j) -> size_t
    { return 1 + (i_ring - 1) * num_u + j % num_u; };

    for (size_t j = 0; j < num_u; ++j)
        AppendFace(mesh, {0, ring(1, j), ring(1, j + 1)});
    for (size_t i_ring = 1; i_ring + 1 < num_v; ++i_ring)
        for (size_t j = 0; j < num_u; ++j)
            AppendFace(mesh, {ring(i_ring, j), ring(i_ring + 1, j), ring(i_ring + 1, j + 1), ring(i_ring, j + 1)});
    for (size_t j = 0; j < num_u; ++j)
        AppendFace(mesh, {ring(num_v - 1, j), south, ring(num_v - 1, j + 1)});

    mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
    return mesh;
}

// Strip of 2*num_quad unit quads, each split into two triangles (4*num_quad faces).
// The first num_quad quads lie in z=0 with normal +z. With fold, the remaining
// quads rise along x=num_quad with normal -x, making one concave 90 degree fold
// between face 2*num_quad-2 and face 2*num_quad+1. Faces below 2*num_quad lie
// before the fold. Without fold the strip is planar.
inline polygonMesh::PolygonMesh MakeTriangulatedStrip(size_t num_quad, bool fold)
{
    polygonMesh::PolygonMesh mesh;
    const double n = double(num_quad);
    for (size_t s = 0; s <= 2 * num_quad; ++s)
    {
        const double t = double(s);
        for (double y : {0.0, 1.0})
        {
            if (!fold || s <= num_quad)
                mesh.vtx2xyz.insert(mesh.vtx2xyz.end(), {t, y, 0.0});
            else
                mesh.vtx2xyz.insert(mesh.vtx2xyz.end(), {n, y, t - n});
        }
    }
    for (size_t s = 0; s < 2 * num_quad; ++s)
    {
        const size_t a = 2 * s, b = 2 * s + 2, c = 2 * s + 3, d = 2 * s + 1;
        AppendFace(mesh, {a, b, c});
        AppendFace(mesh, {a, c, d});
    }
    mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
    return mesh;
}

// Regular tetrahedron, outward triangles.
//   v0=(1,1,1)  v1=(1,-1,-1)  v2=(-1,1,-1)  v3=(-1,-1,1)
inline polygonMesh::PolygonMesh MakeTetrahedron()
{
    return MakePolygonMesh(
        {1, 1, 1,
         1, -1, -1,
         -1, 1, -1,
         -1, -1, 1},
        {{0, 1, 2},
         {0, 2, 3},
         {0, 3, 1},
         {1, 3, 2}});
}

// Tetrahedron with a fin triangle (face 4) hinged on edge (0,1).
// Edge (0,1) then has three faces and is non-manifold, the fin touches no
// other edge of the tetrahedron.
inline polygonMesh::PolygonMesh MakeNonManifoldFan()
{
    polygonMesh::PolygonMesh mesh = MakeTetrahedron();
    mesh.vtx2xyz.insert(mesh.vtx2xyz.end(), {3.0, 2.0, 0.0});
    AppendFace(mesh, {0, 1, 4});
    mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
    return mesh;
}
