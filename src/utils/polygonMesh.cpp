#include "polygonMesh.h"

#include <cmath>

namespace polygonMesh
{
    Edge2Elem edge2elem_from_polygon_mesh(
        const vector<size_t> &elem2idx,
        const vector<size_t> &idx2vtx)
    {
        Edge2Elem edge2elem;
        if (elem2idx.empty())
            return edge2elem;

        const size_t num_elem = elem2idx.size() - 1;
        for (size_t i_elem = 0; i_elem < num_elem; ++i_elem)
        {
            const size_t begin = elem2idx[i_elem];
            const size_t n = elem2idx[i_elem + 1] - begin;

            // polygon 中所有边
            for (size_t e = 0; e < n; ++e)
            {
                size_t v0 = idx2vtx[begin + e];
                size_t v1 = idx2vtx[begin + (e + 1) % n];
                if (v0 == v1)
                    continue;
                edge2elem[EdgeKey(v0, v1)].push_back(i_elem);
            }
        }
        return edge2elem;
    }

    pair<vector<size_t>, vector<size_t>> elem2elem_from_edge2elem(
        const Edge2Elem &edge2elem,
        size_t num_elem)
    {
        // count, then prefix sum, then fill
        vector<size_t> elem2jdx(num_elem + 1, 0);
        for (const auto &[edge, elems] : edge2elem)
        {
            if (elems.size() != 2)
                continue;
            elem2jdx[elems[0] + 1] += 1;
            elem2jdx[elems[1] + 1] += 1;
        }

        for (size_t i = 0; i < num_elem; ++i)
        {
            elem2jdx[i + 1] += elem2jdx[i];
        }

        vector<size_t> jdx2elem(elem2jdx[num_elem]);
        vector<size_t> elem2jdx_copy = elem2jdx;
        for (const auto &[edge, elems] : edge2elem)
        {
            if (elems.size() != 2)
                continue;
            const size_t i = elems[0];
            const size_t j = elems[1];
            jdx2elem[elem2jdx_copy[i]++] = j;
            jdx2elem[elem2jdx_copy[j]++] = i;
        }

        return {elem2jdx, jdx2elem};
    }

    vector<double> elem2nrm_from_polygon_mesh(
        const vector<size_t> &elem2idx,
        const vector<size_t> &idx2vtx,
        const vector<double> &vtx2xyz)
    {
        const size_t num_elem = elem2idx.empty() ? 0 : elem2idx.size() - 1;
        vector<double> elem2nrm(num_elem * 3, 0.0);

        for (size_t i_elem = 0; i_elem < num_elem; ++i_elem)
        {
            const size_t begin = elem2idx[i_elem];
            const size_t n = elem2idx[i_elem + 1] - begin;

            double nx = 0.0, ny = 0.0, nz = 0.0;
            for (size_t e = 0; e < n; ++e)
            {
                const double *p = &vtx2xyz[idx2vtx[begin + e] * 3];
                const double *q = &vtx2xyz[idx2vtx[begin + (e + 1) % n] * 3];
                nx += (p[1] - q[1]) * (p[2] + q[2]);
                ny += (p[2] - q[2]) * (p[0] + q[0]);
                nz += (p[0] - q[0]) * (p[1] + q[1]);
            }

            const double len = std::sqrt(nx * nx + ny * ny + nz * nz);
            if (len <= 0.0)
                continue;

            elem2nrm[i_elem * 3 + 0] = nx / len;
            elem2nrm[i_elem * 3 + 1] = ny / len;
            elem2nrm[i_elem * 3 + 2] = nz / len;
        }

        return elem2nrm;
    }
}
