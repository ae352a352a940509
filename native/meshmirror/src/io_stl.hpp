// io_stl.hpp - STL (ASCII and binary) loader/saver.
//
// STL stores an unindexed triangle soup. On load, corners with equal
// coordinates (so -0.0 and +0.0 too) are welded into one vertex so that edge
// adjacency (and thus the consistency diagnostics) is meaningful. Stored facet
// normals are ignored; the pipeline recomputes them from winding.
//
// Loading is strict: a non-finite coordinate, a facet without exactly three
// vertices, a vertex outside "outer loop"/"endloop", or a facet missing its
// "endfacet" fails the whole file.
//
// Binary files are read/written as little-endian IEEE floats (host order on
// every platform we build for).
//
#pragma once
#include "mesh.hpp"
#include <string>

// Autodetects ASCII vs binary. On failure returns false and fills `err`.
bool load_stl(const std::string& path, Mesh& mesh, std::string& err);

// Facet normals come from mesh.face_normals when present, otherwise they are
// computed from winding (zero for degenerate faces).
bool save_stl(const std::string& path, const Mesh& mesh, bool ascii, std::string& err);
