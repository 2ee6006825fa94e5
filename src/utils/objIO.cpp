#include "objIO.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace objIO
{
    namespace
    {
        void trim(std::string &s)
        {
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
                s.pop_back();
        }

        // first field of "i/t/n", 1-based or negative relative to the vertices read so far
        size_t parse_vertex_index(const std::string &tok, size_t num_vtx, const std::string &where)
        {
            const size_t p = tok.find('/');
            const std::string a = (p == std::string::npos) ? tok : tok.substr(0, p);

            long long idx = 0;
            try
            {
                size_t used = 0;
                idx = std::stoll(a, &used);
                if (used != a.size())
                    throw std::invalid_argument(a);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(where + ": bad vertex index '" + tok + "'");
            }

            long long i_vtx = idx > 0 ? idx - 1 : static_cast<long long>(num_vtx) + idx;
            if (idx == 0 || i_vtx < 0 || i_vtx >= static_cast<long long>(num_vtx))
                throw std::runtime_error(where + ": vertex index " + a + " out of range");
            return static_cast<size_t>(i_vtx);
        }

        std::string mtl_path_for(const std::string &path)
        {
            const size_t slash = path.find_last_of("/\\");
            const size_t dot = path.find_last_of('.');
            if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
                return path + ".mtl";
            return path.substr(0, dot) + ".mtl";
        }

        std::string file_name_of(const std::string &path)
        {
            const size_t slash = path.find_last_of("/\\");
            return slash == std::string::npos ? path : path.substr(slash + 1);
        }
    }

    polygonMesh::PolygonMesh parse_obj_polygon_mesh(std::istream &in, const std::string &name)
    {
        polygonMesh::PolygonMesh mesh;

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            std::istringstream iss(line);
            std::string tok;
            iss >> tok;
            const std::string where = name + ":" + std::to_string(line_no);

            if (tok == "v")
            {
                double x, y, z;
                if (!(iss >> x >> y >> z))
                    throw std::runtime_error(where + ": bad vertex record");
                mesh.vtx2xyz.push_back(x);
                mesh.vtx2xyz.push_back(y);
                mesh.vtx2xyz.push_back(z);
            }
            else if (tok == "f")
            {
                const size_t num_vtx = mesh.num_vtx();
                size_t num_corner = 0;
                std::string corner;
                while (iss >> corner)
                {
                    mesh.idx2vtx.push_back(parse_vertex_index(corner, num_vtx, where));
                    ++num_corner;
                }
                if (num_corner < 3)
                    throw std::runtime_error(where + ": face with fewer than 3 corners");
                mesh.elem2idx.push_back(mesh.idx2vtx.size());
            }
            // vt, vn, g, o, s, usemtl, mtllib are not needed
        }

        if (in.bad())
            throw std::runtime_error(name + ": read error");
        if (mesh.num_elem() == 0)
            throw std::runtime_error(name + ": no faces");

        mesh.elem2nrm = polygonMesh::elem2nrm_from_polygon_mesh(mesh.elem2idx, mesh.idx2vtx, mesh.vtx2xyz);
        return mesh;
    }

    polygonMesh::PolygonMesh load_obj_polygon_mesh(const std::string &path)
    {
        std::ifstream ifs(path);
        if (!ifs)
            throw std::runtime_error("cannot open: " + path);
        return parse_obj_polygon_mesh(ifs, path);
    }

    std::array<float, 3> segment_rgb_from_id(size_t segment_id, size_t num_segment)
    {
        if (segment_id >= num_segment)
            return {0.f, 0.f, 0.f};
        float t = float(segment_id) / float(std::max<size_t>(1, num_segment));
        float h = t * 360.0f; // hue
        float s = 0.6f;
        float v = 0.9f;

        float c = v * s;
        float x = c * (1 - std::fabs(std::fmod(h / 60.0f, 2.0f) - 1));
        float m = v - c;

        float r = 0, g = 0, b = 0;
        if (h < 60)
        {
            r = c;
            g = x;
        }
        else if (h < 120)
        {
            r = x;
            g = c;
        }
        else if (h < 180)
        {
            g = c;
            b = x;
        }
        else if (h < 240)
        {
            g = x;
            b = c;
        }
        else if (h < 300)
        {
            r = x;
            b = c;
        }
        else
        {
            r = c;
            b = x;
        }
        return {r + m, g + m, b + m};
    }

    void save_obj_segments(const std::string &path,
                           const polygonMesh::PolygonMesh &mesh,
                           const std::vector<size_t> &labels,
                           size_t num_segment)
    {
        const size_t num_elem = mesh.num_elem();
        if (labels.size() != num_elem)
            throw std::runtime_error("save_obj_segments: expected one label per face");
        for (size_t label : labels)
        {
            if (label >= num_segment)
                throw std::runtime_error("save_obj_segments: label " + std::to_string(label) + " out of range");
        }

        const std::string mtl_path = mtl_path_for(path);
        {
            std::ofstream mtl(mtl_path);
            if (!mtl)
                throw std::runtime_error("cannot write: " + mtl_path);
            mtl << "# mesh segmentation materials" << std::endl;
            for (size_t c = 0; c < num_segment; ++c)
            {
                const std::array<float, 3> rgb = segment_rgb_from_id(c, num_segment);
                mtl << std::endl
                    << "newmtl segment_" << c << std::endl;
                mtl << "Kd " << rgb[0] << " " << rgb[1] << " " << rgb[2] << std::endl;
            }
            if (!mtl)
                throw std::runtime_error("write failed: " + mtl_path);
        }

        std::ofstream f(path);
        if (!f)
            throw std::runtime_error("cannot write: " + path);
        f << "# OBJ File saved from meshSegmentation, " << num_segment << " segments" << std::endl
          << std::endl;
        f << "mtllib " << file_name_of(mtl_path) << std::endl
          << std::endl;

        f.precision(17);
        for (size_t i_vtx = 0; i_vtx < mesh.num_vtx(); ++i_vtx)
        {
            f << "v " << mesh.vtx2xyz[i_vtx * 3 + 0] << " "
              << mesh.vtx2xyz[i_vtx * 3 + 1] << " "
              << mesh.vtx2xyz[i_vtx * 3 + 2] << std::endl;
        }

        for (size_t c = 0; c < num_segment; ++c)
        {
            f << "g segment_" << c << std::endl;
            f << "usemtl segment_" << c << std::endl;
            for (size_t i_elem = 0; i_elem < num_elem; ++i_elem)
            {
                if (labels[i_elem] != c)
                    continue;
                f << "f";
                for (size_t k = mesh.elem2idx[i_elem]; k < mesh.elem2idx[i_elem + 1]; ++k)
                    f << " " << mesh.idx2vtx[k] + 1;
                f << std::endl;
            }
        }

        if (!f)
            throw std::runtime_error("write failed: " + path);
    }
}
