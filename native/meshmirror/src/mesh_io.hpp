// mesh_io.hpp - Format dispatch by file extension, and mirrored output naming.
#pragma once
#include "mesh.hpp"
#include <string>

// .obj -> io_obj, .stl -> io_stl (extension compared case-insensitively).
bool load_mesh(const std::string& path, Mesh& mesh, std::string& err);
bool save_mesh(const std::string& path, const Mesh& mesh, bool stl_ascii, std::string& err);

// Output path for a mirrored part, in the same directory as `path`:
// a left/right prefix is swapped (L_<->R_, l_<->r_), anything else gets
// "mirrored_" prepended. "arm/L_hand.stl" -> "arm/R_hand.stl".
std::string mirrored_filename(const std::string& path);
