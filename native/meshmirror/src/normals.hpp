// normals.hpp - Face and vertex normal recomputation from current winding.
#pragma once
#include "mesh.hpp"
#include <vector>

enum class VertexWeighting {
    Area,   // sum of unnormalized face cross products (weight ~ face area)
    Equal,  // sum of unit face normals
};

struct NormalOptions {
    // A face is degenerate when |(b-a)x(c-a)| <= degenerate_eps * L^2,
    // L being its longest edge. Scale-free, so it works in any unit.
    double degenerate_eps = 1e-12;
    bool   vertex_normals = true;
    VertexWeighting weighting = VertexWeighting::Area;
};

// Non-fatal record of a face whose normal could not be defined.
struct DegenerateFace {
    int face = -1;
    double cross_length = 0.0;  // |(b-a)x(c-a)| as computed
    double longest_edge = 0.0;
};

// Recompute mesh.face_normals (and mesh.vertex_normals when enabled).
// Degenerate faces receive a zero normal and are appended to `degenerate`
// in ascending face order; they are excluded from vertex smoothing.
// Assumes indices were validated.
void recompute_normals(Mesh& mesh, const NormalOptions& opt, std::vector<DegenerateFace>& degenerate);

VertexWeighting parse_weighting(const std::string& s, bool& ok);
const char* weighting_name(VertexWeighting w);
