#pragma once

#include <vector>
#include <map>
#include <algorithm>
#include <limits>
#include <cstdint>
#include <cassert>
#include <type_traits>

namespace polygonMesh
{

    using std::vector, std::pair;

    static constexpr size_t INVALID = static_cast<size_t>(std::numeric_limits<int64_t>::max());

    // Flat polygon mesh:
    //  elem2idx[i]..elem2idx[i+1] is the corner range of face i in idx2vtx
    //  vtx2xyz holds x,y,z for every vertex
    //  elem2nrm holds the unit normal x,y,z of every face
    struct PolygonMesh
    {
        vector<size_t> elem2idx{0};
        vector<size_t> idx2vtx;
        vector<double> vtx2xyz;
        vector<double> elem2nrm;

        size_t num_elem() const { return elem2idx.empty() ? 0 : elem2idx.size() - 1; }
        size_t num_vtx() const { return vtx2xyz.size() / 3; }
    };

    // unordered vertex pair, smaller index first
    struct EdgeKey
    {
        size_t v0, v1;

        EdgeKey(size_t a, size_t b) : v0(std::min(a, b)), v1(std::max(a, b)) {}

        bool operator<(const EdgeKey &o) const
        {
            return v0 < o.v0 || (v0 == o.v0 && v1 < o.v1);
        }
        bool operator==(const EdgeKey &o) const
        {
            return v0 == o.v0 && v1 == o.v1;
        }
    };

    using Edge2Elem = std::map<EdgeKey, vector<size_t>>;

    // edge -> faces containing it, faces appended in scan order
    Edge2Elem edge2elem_from_polygon_mesh(
        const vector<size_t> &elem2idx,
        const vector<size_t> &idx2vtx);

    // face -> adjacent faces over manifold edges (edges with exactly two faces)
    //  adjacent faces of elem i are jdx2elem[elem2jdx[i] .. elem2jdx[i+1]-1]
    pair<vector<size_t>, vector<size_t>> elem2elem_from_edge2elem(
        const Edge2Elem &edge2elem,
        size_t num_elem);

    // Newell normal of every polygon, normalized; zero for degenerate polygons
    vector<double> elem2nrm_from_polygon_mesh(
        const vector<size_t> &elem2idx,
        const vector<size_t> &idx2vtx,
        const vector<double> &vtx2xyz);

    template <typename ElemAdj2Elem>
    void elem2group_mark_connected_elements_for_polygon_mesh(
        std::vector<size_t> &elem2group,
        size_t idx_elem_kernel,
        size_t idx_group,
        const std::vector<size_t> &elem2jdx,
        ElemAdj2Elem elemadj2elem)
    {
        const size_t num_elem = elem2group.size();
        assert(num_elem + 1 == elem2jdx.size());

        elem2group[idx_elem_kernel] = idx_group;

        std::vector<size_t> next;
        next.push_back(idx_elem_kernel);

        while (!next.empty())
        {
            size_t i_elem0 = next.back();
            next.pop_back();

            size_t num_adj = elem2jdx[i_elem0 + 1] - elem2jdx[i_elem0];

            for (size_t i_adj = 0; i_adj < num_adj; ++i_adj)
            {
                size_t j_elem = elemadj2elem(i_elem0, i_adj);
                if (j_elem == INVALID)
                    continue;

                if (elem2group[j_elem] != idx_group)
                {
                    elem2group[j_elem] = idx_group;
                    next.push_back(j_elem);
                }
            }
        }
    }

    // connected components, returns (num_group, elem2group)
    template <typename ElemAdj2Elem>
    std::pair<size_t, std::vector<size_t>>
    elem2group_from_polygon_mesh(
        const std::vector<size_t> &elem2jdx,
        ElemAdj2Elem elemadj2elem)
    {
        const size_t nelem = elem2jdx.size() - 1;

        std::vector<size_t> elem2group(nelem, INVALID);

        size_t i_group = 0;
        for (size_t kernel = 0; kernel < nelem; ++kernel)
        {
            if (elem2group[kernel] != INVALID)
                continue;

            elem2group_mark_connected_elements_for_polygon_mesh(
                elem2group,
                kernel,
                i_group,
                elem2jdx,
                elemadj2elem);

            ++i_group;
        }

        return {i_group, elem2group};
    }

    template <typename T>
    std::vector<T> elem2center_from_polygon_mesh_as_points(
        const std::vector<size_t> &elem2idx,
        const std::vector<size_t> &idx2vtx,
        const std::vector<T> &vtx2xyz,
        size_t num_dim)
    {
        static_assert(std::is_floating_point<T>::value,
                      "T must be float or double");

        const size_t num_elem = elem2idx.size() - 1;

        std::vector<T> cog(num_dim, T(0));
        std::vector<T> elem2cog;
        elem2cog.reserve(num_elem * num_dim);

        for (size_t i_elem = 0; i_elem < num_elem; ++i_elem)
        {
            std::fill(cog.begin(), cog.end(), T(0));

            const size_t start = elem2idx[i_elem];
            const size_t end = elem2idx[i_elem + 1];
            const size_t num_vtx_in_elem = end - start;

            for (size_t k = start; k < end; ++k)
            {
                size_t i_vtx = idx2vtx[k];
                for (size_t d = 0; d < num_dim; ++d)
                {
                    cog[d] += vtx2xyz[i_vtx * num_dim + d];
                }
            }

            const T ratio = (num_vtx_in_elem == 0)
                                ? T(0)
                                : T(1) / T(num_vtx_in_elem);

            for (size_t d = 0; d < num_dim; ++d)
            {
                elem2cog.push_back(cog[d] * ratio);
            }
        }

        return elem2cog;
    }
}
