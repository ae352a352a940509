// normals.cpp - Normal recomputation.
//
// Flow:
// 1) Per face (parallel): cross product in winding order, degeneracy test
//    relative to the longest edge, normalize or zero.
// 2) Collect degenerate faces in face order (serial, so the report is stable).
// 3) Optional vertex smoothing: accumulate adjacent face contributions in face
//    order and normalize. Serial so that floating point sums are reproducible.

#include "normals.hpp"
#include <algorithm>
#include <cmath>

void recompute_normals(Mesh& mesh, const NormalOptions& opt, std::vector<DegenerateFace>& degenerate){
    const int nf = (int)mesh.faces.size();
    std::vector<Vec3> crosses(nf);
    std::vector<double> longest(nf, 0.0);
    std::vector<char> is_degen(nf, 0);
    mesh.face_normals.assign(nf, Vec3{});

#pragma omp parallel for
    for (int i = 0; i < nf; ++i) {
        const Tri& f = mesh.faces[i];
        const Vec3& p = mesh.verts[f.a];
        const Vec3& q = mesh.verts[f.b];
        const Vec3& r = mesh.verts[f.c];
        Vec3 n = cross(sub(q, p), sub(r, p));
        double L2 = std::max(dot3(sub(q,p),sub(q,p)), std::max(dot3(sub(r,q),sub(r,q)), dot3(sub(p,r),sub(p,r))));
        double cl = len3(n);
        crosses[i] = n;
        longest[i] = std::sqrt(L2);
        if (L2 == 0.0 || !std::isfinite(cl) || cl <= opt.degenerate_eps * L2) {
            is_degen[i] = 1;
            continue;
        }
        mesh.face_normals[i] = scale(n, 1.0 / cl);
    }

    for (int i = 0; i < nf; ++i) {
        if (!is_degen[i]) continue;
        degenerate.push_back(DegenerateFace{i, len3(crosses[i]), longest[i]});
    }

    mesh.vertex_normals.clear();
    if (!opt.vertex_normals) return;

    std::vector<Vec3> acc(mesh.verts.size());
    for (int i = 0; i < nf; ++i) {
        if (is_degen[i]) continue;
        const Tri& f = mesh.faces[i];
        Vec3 w = opt.weighting == VertexWeighting::Area ? crosses[i] : mesh.face_normals[i];
        acc[f.a] = add(acc[f.a], w);
        acc[f.b] = add(acc[f.b], w);
        acc[f.c] = add(acc[f.c], w);
    }
    // Opposing contributions can cancel (e.g. a vertex shared by two
    // back-to-back faces); such vertices keep a zero normal.
    for (auto& v : acc) {
        double L = len3(v);
        v = (L > 0.0 && std::isfinite(L)) ? scale(v, 1.0 / L) : Vec3{};
    }
    mesh.vertex_normals.swap(acc);
}

VertexWeighting parse_weighting(const std::string& s, bool& ok){
    ok = true;
    if (s == "area") return VertexWeighting::Area;
    if (s == "equal") return VertexWeighting::Equal;
    ok = false;
    return VertexWeighting::Area;
}

const char* weighting_name(VertexWeighting w){
    return w == VertexWeighting::Area ? "area" : "equal";
}
