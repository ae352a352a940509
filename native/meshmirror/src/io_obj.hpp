// io_obj.hpp - Minimal OBJ (triangles-only) loader/saver for meshmirror.
//
// Scope and limitations:
// - Reads vertex positions (v) and triangle faces (f i j k).
// - Ignores texture/normal indices (vt/vn) on input; normals are derived data
//   and are always recomputed by the pipeline.
// - Accepts positive (1-based) and negative (relative) indices, converts to 0-based.
// - Lines starting with '#' are treated as comments and skipped.
//
#pragma once
#include "mesh.hpp"
#include <string>

// Load triangles from an OBJ file located at `path` into `mesh`.
// On failure, returns false and writes a human-readable message to `err`.
bool load_obj_tri(const std::string& path, Mesh& mesh, std::string& err);

// Save the triangle mesh to an OBJ file located at `path`. When the mesh has
// vertex normals they are written as `vn` records and referenced as f i//i.
// On failure, returns false and writes a human-readable message to `err`.
bool save_obj_tri(const std::string& path, const Mesh& mesh, std::string& err);
