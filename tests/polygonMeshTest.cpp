#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "polygonMesh.h"
#include "testMeshBuilders.h"

TEST(PolygonMesh, CubeEdgesHaveTwoFaces)
{
    polygonMesh::PolygonMesh mesh = MakeUnitCube();
    ASSERT_EQ(mesh.num_elem(), 6u);
    ASSERT_EQ(mesh.num_vtx(), 8u);

    polygonMesh::Edge2Elem edge2elem = polygonMesh::edge2elem_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx);
    EXPECT_EQ(edge2elem.size(), 12u);
    for (const auto &[edge, elems] : edge2elem)
    {
        EXPECT_LT(edge.v0, edge.v1);
        EXPECT_EQ(elems.size(), 2u);
    }
}

TEST(PolygonMesh, EdgeKeyIsUnordered)
{
    polygonMesh::EdgeKey a(5, 2);
    polygonMesh::EdgeKey b(2, 5);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.v0, 2u);
    EXPECT_EQ(a.v1, 5u);
    EXPECT_FALSE(a < b);
    EXPECT_TRUE(polygonMesh::EdgeKey(1, 9) < a);
}

TEST(PolygonMesh, CubeFaceAdjacency)
{
    polygonMesh::PolygonMesh mesh = MakeUnitCube();
    auto edge2elem = polygonMesh::edge2elem_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx);
    auto [elem2jdx, jdx2elem] = polygonMesh::elem2elem_from_edge2elem(edge2elem, mesh.num_elem());

    ASSERT_EQ(elem2jdx.size(), 7u);
    EXPECT_EQ(jdx2elem.size(), 24u);

    const size_t opposite[6] = {1, 0, 3, 2, 5, 4};
    for (size_t i = 0; i < 6; ++i)
    {
        ASSERT_EQ(elem2jdx[i + 1] - elem2jdx[i], 4u);
        for (size_t j = elem2jdx[i]; j < elem2jdx[i + 1]; ++j)
        {
            EXPECT_NE(jdx2elem[j], i);
            EXPECT_NE(jdx2elem[j], opposite[i]);
        }
    }
}

TEST(PolygonMesh, NonManifoldEdgeIsNotAdjacency)
{
    polygonMesh::PolygonMesh mesh = MakeNonManifoldFan();
    auto edge2elem = polygonMesh::edge2elem_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx);

    auto it = edge2elem.find(polygonMesh::EdgeKey(0, 1));
    ASSERT_NE(it, edge2elem.end());
    EXPECT_EQ(it->second.size(), 3u);

    auto [elem2jdx, jdx2elem] = polygonMesh::elem2elem_from_edge2elem(edge2elem, mesh.num_elem());
    // the fin has no neighbour
    EXPECT_EQ(elem2jdx[5] - elem2jdx[4], 0u);
    // 5 manifold edges remain on the tetrahedron
    EXPECT_EQ(jdx2elem.size(), 10u);
}

TEST(PolygonMesh, ConnectedComponents)
{
    polygonMesh::PolygonMesh mesh = MakeTwoCubes();
    auto edge2elem = polygonMesh::edge2elem_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx);
    auto elem2elem = polygonMesh::elem2elem_from_edge2elem(edge2elem, mesh.num_elem());
    const std::vector<size_t> &elem2jdx = elem2elem.first;
    const std::vector<size_t> &jdx2elem = elem2elem.second;

    auto [num_group, elem2group] = polygonMesh::elem2group_from_polygon_mesh(
        elem2jdx,
        [&](size_t i_elem, size_t i_adj)
        { return jdx2elem[elem2jdx[i_elem] + i_adj]; });

    EXPECT_EQ(num_group, 2u);
    ASSERT_EQ(elem2group.size(), 12u);
    for (size_t i = 0; i < 6; ++i)
    {
        EXPECT_EQ(elem2group[i], 0u);
        EXPECT_EQ(elem2group[i + 6], 1u);
    }
}

TEST(PolygonMesh, NewellNormalsPointOutward)
{
    polygonMesh::PolygonMesh mesh = MakeUnitCube();
    const double expected[6][3] = {
        {0, 0, -1}, {0, 0, 1}, {0, -1, 0}, {0, 1, 0}, {-1, 0, 0}, {1, 0, 0}};

    ASSERT_EQ(mesh.elem2nrm.size(), 18u);
    for (size_t i = 0; i < 6; ++i)
        for (size_t d = 0; d < 3; ++d)
            EXPECT_NEAR(mesh.elem2nrm[i * 3 + d], expected[i][d], 1e-12);
}

TEST(PolygonMesh, DegenerateFaceHasZeroNormal)
{
    polygonMesh::PolygonMesh mesh = MakePolygonMesh(
        {0, 0, 0,
         1, 0, 0,
         2, 0, 0},
        {{0, 1, 2}});
    for (double v : mesh.elem2nrm)
        EXPECT_EQ(v, 0.0);
}

TEST(PolygonMesh, FaceCenters)
{
    polygonMesh::PolygonMesh mesh = MakeUnitCube();
    std::vector<double> elem2cog = polygonMesh::elem2center_from_polygon_mesh_as_points(
        mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz, 3);
    ASSERT_EQ(elem2cog.size(), 18u);
    // top face
    EXPECT_DOUBLE_EQ(elem2cog[3], 0.5);
    EXPECT_DOUBLE_EQ(elem2cog[4], 0.5);
    EXPECT_DOUBLE_EQ(elem2cog[5], 1.0);
}
