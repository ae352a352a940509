// mesh_io.cpp - Extension dispatch and output naming.

#include "mesh_io.hpp"
#include "io_obj.hpp"
#include "io_stl.hpp"
#include <algorithm>
#include <cctype>

static std::string lower_ext(const std::string& path){
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return std::string();
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return ext;
}

bool load_mesh(const std::string& path, Mesh& mesh, std::string& err){
    std::string ext = lower_ext(path);
    if (ext == ".obj") return load_obj_tri(path, mesh, err);
    if (ext == ".stl") return load_stl(path, mesh, err);
    err = "unsupported input format '" + ext + "': " + path;
    return false;
}

bool save_mesh(const std::string& path, const Mesh& mesh, bool stl_ascii, std::string& err){
    std::string ext = lower_ext(path);
    if (ext == ".obj") return save_obj_tri(path, mesh, err);
    if (ext == ".stl") return save_stl(path, mesh, stl_ascii, err);
    err = "unsupported output format '" + ext + "': " + path;
    return false;
}

std::string mirrored_filename(const std::string& path){
    size_t slash = path.find_last_of("/\\");
    std::string dir = slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    static const char* const swaps[4][2] = {{"L_", "R_"}, {"l_", "r_"}, {"R_", "L_"}, {"r_", "l_"}};
    for (auto& s : swaps) {
        if (name.compare(0, 2, s[0]) == 0) return dir + s[1] + name.substr(2);
    }
    return dir + "mirrored_" + name;
}
