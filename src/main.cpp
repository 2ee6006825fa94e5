#include <iostream>
#include <stdexcept>
#include <string>
#include "meshSegmentation.h"
#include "objIO.h"

namespace
{
    void print_usage(const char *prog)
    {
        std::cerr << "usage: " << prog << " <in.obj> [-k N] [--delta D] [--eta E]"
                  << " [--solver dense|sparse] [--init kmeans++|greedy] [--seed S]"
                  << " [-o out.obj] [--quiet]" << std::endl;
    }

    std::string default_output_path(const std::string &input)
    {
        const size_t slash = input.find_last_of("/\\");
        const size_t dot = input.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
            return input + "_segmented.obj";
        return input.substr(0, dot) + "_segmented.obj";
    }
}

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 2;
    }

    std::string in_path;
    std::string out_path;
    size_t k = 2;
    meshSegmentation::SegmentationParams params;
    params.verbose = true;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw meshSegmentation::InputError("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "-k")
                k = std::stoul(value());
            else if (arg == "--delta")
                params.delta = std::stod(value());
            else if (arg == "--eta")
                params.eta = std::stod(value());
            else if (arg == "--solver")
                params.solver = meshSegmentation::parse_eigen_solver(value());
            else if (arg == "--init")
                params.init = meshSegmentation::parse_kmeans_init(value());
            else if (arg == "--seed")
                params.seed = std::stoull(value());
            else if (arg == "-o")
                out_path = value();
            else if (arg == "--quiet")
                params.verbose = false;
            else if (arg == "-h" || arg == "--help")
            {
                print_usage(argv[0]);
                return 0;
            }
            else if (!arg.empty() && arg[0] == '-')
                throw meshSegmentation::InputError("unknown option " + arg);
            else
                in_path = arg;
        }
        if (in_path.empty())
            throw meshSegmentation::InputError("no input file");
    }
    catch (const std::logic_error &e)
    {
        // InputError, and std::stoul / std::stod failures
        std::cerr << "error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (out_path.empty())
        out_path = default_output_path(in_path);

    try
    {
        polygonMesh::PolygonMesh mesh = objIO::load_obj_polygon_mesh(in_path);
        if (params.verbose)
        {
            std::cout << "Loaded " << in_path << ": " << mesh.num_vtx() << " vertices, "
                      << mesh.num_elem() << " faces" << std::endl;
            std::cout << "delta=" << params.delta << " eta=" << params.eta
                      << " solver=" << meshSegmentation::to_string(params.solver)
                      << " init=" << meshSegmentation::to_string(params.init) << std::endl;
        }

        meshSegmentation::segment(
            mesh, k, params,
            [&](const polygonMesh::PolygonMesh &m, size_t num_segment, const std::vector<size_t> &labels)
            {
                objIO::save_obj_segments(out_path, m, labels, num_segment);
                if (params.verbose)
                    std::cout << "Wrote " << out_path << std::endl;
            });
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
