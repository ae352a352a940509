// validator.cpp - Edge incidence and duplicate-face scan.

#include "validator.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>

static inline uint64_t edge_key(int u, int v){
    if (u > v) std::swap(u, v);
    return ((uint64_t)(uint32_t)u << 32) | (uint64_t)(uint32_t)v;
}

ConsistencyReport validate_consistency(const Mesh& mesh){
    ConsistencyReport rep;

    // undirected edge -> incident faces (in face order, so already ascending)
    std::unordered_map<uint64_t, std::vector<int>> edges;
    edges.reserve(mesh.faces.size() * 2);
    for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
        const Tri& f = mesh.faces[fi];
        const int e[3][2] = {{f.a, f.b}, {f.b, f.c}, {f.c, f.a}};
        for (auto& uv : e) {
            if (uv[0] == uv[1]) continue;
            auto& list = edges[edge_key(uv[0], uv[1])];
            // a face with two equal corners would list the same edge twice
            if (list.empty() || list.back() != (int)fi) list.push_back((int)fi);
        }
    }

    std::vector<uint64_t> keys;
    keys.reserve(edges.size());
    for (auto& kv : edges) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    for (uint64_t k : keys) {
        const auto& list = edges[k];
        if (list.size() == 2) continue;
        ConsistencyWarning w;
        w.kind = list.size() == 1 ? WarningKind::BoundaryEdge : WarningKind::NonManifoldEdge;
        w.v0 = (int)(k >> 32);
        w.v1 = (int)(k & 0xffffffffu);
        w.faces = list;
        if (w.kind == WarningKind::BoundaryEdge) rep.boundary_edges++;
        else rep.non_manifold_edges++;
        rep.warnings.push_back(std::move(w));
    }

    std::map<std::array<int,3>, int> first_seen;
    for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
        const Tri& f = mesh.faces[fi];
        std::array<int,3> key = {f.a, f.b, f.c};
        std::sort(key.begin(), key.end());
        auto ins = first_seen.emplace(key, (int)fi);
        if (ins.second) continue;
        ConsistencyWarning w;
        w.kind = WarningKind::DuplicateFace;
        w.faces = {ins.first->second, (int)fi};
        rep.duplicate_faces++;
        rep.warnings.push_back(std::move(w));
    }
    return rep;
}

const char* warning_kind_name(WarningKind kind){
    switch (kind) {
        case WarningKind::BoundaryEdge: return "BoundaryEdge";
        case WarningKind::NonManifoldEdge: return "NonManifoldEdge";
        case WarningKind::DuplicateFace: return "DuplicateFace";
    }
    return "Unknown";
}
