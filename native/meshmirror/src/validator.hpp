// validator.hpp - Read-only topology diagnostics on a triangle mesh.
//
// Nothing here is fatal and nothing mutates the mesh. The winding fix does not
// need this information; exporters may want to act on it.
//
#pragma once
#include "mesh.hpp"
#include <vector>

enum class WarningKind {
    BoundaryEdge,     // undirected edge used by exactly one face (open mesh)
    NonManifoldEdge,  // undirected edge used by more than two faces
    DuplicateFace,    // same vertex set as an earlier face, any winding
};

struct ConsistencyWarning {
    WarningKind kind = WarningKind::BoundaryEdge;
    // Edge endpoints (v0 < v1) for edge warnings; -1 for DuplicateFace.
    int v0 = -1, v1 = -1;
    // Edge warnings: all faces using the edge, ascending.
    // DuplicateFace: {first occurrence, duplicate}.
    std::vector<int> faces;
};

struct ConsistencyReport {
    std::vector<ConsistencyWarning> warnings;
    size_t boundary_edges = 0;
    size_t non_manifold_edges = 0;
    size_t duplicate_faces = 0;

    bool clean() const { return warnings.empty(); }
};

// Edge warnings come first, ordered by (v0, v1); duplicates follow in face order.
// Edges whose two endpoints are the same index are ignored.
ConsistencyReport validate_consistency(const Mesh& mesh);

const char* warning_kind_name(WarningKind kind);
