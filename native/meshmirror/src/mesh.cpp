// mesh.cpp - Small helpers on top of the Mesh container.

#include "mesh.hpp"
#include "errors.hpp"
#include <sstream>

void Mesh::clear() {
    verts.clear();
    faces.clear();
    discard_normals();
}

void Mesh::discard_normals() {
    face_normals.clear();
    vertex_normals.clear();
}

bool validate_indices(const Mesh& mesh, MirrorError& err) {
    const long long nv = (long long)mesh.verts.size();
    for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
        const Tri& f = mesh.faces[fi];
        const int idx[3] = {f.a, f.b, f.c};
        for (int k = 0; k < 3; ++k) {
            if (idx[k] >= 0 && idx[k] < nv) continue;
            std::ostringstream oss;
            oss << "face " << fi << " corner " << "abc"[k] << " references vertex "
                << idx[k] << " but mesh has " << nv << " vertices";
            err.kind = MirrorErrorKind::InvalidMesh;
            err.face = (int)fi;
            err.corner = k;
            err.value = idx[k];
            err.message = oss.str();
            return false;
        }
    }
    return true;
}

Vec3 vertex_centroid(const Mesh& mesh) {
    Vec3 c;
    if (mesh.verts.empty()) return c;
    for (auto& v : mesh.verts) c = add(c, v);
    return scale(c, 1.0 / (double)mesh.verts.size());
}

Vec3 face_centroid(const Mesh& mesh, size_t fi) {
    const Tri& f = mesh.faces[fi];
    Vec3 c = add(add(mesh.verts[f.a], mesh.verts[f.b]), mesh.verts[f.c]);
    return scale(c, 1.0 / 3.0);
}

const char* error_kind_name(MirrorErrorKind kind) {
    switch (kind) {
        case MirrorErrorKind::None: return "None";
        case MirrorErrorKind::InvalidTransform: return "InvalidTransform";
        case MirrorErrorKind::InvalidMesh: return "InvalidMesh";
    }
    return "Unknown";
}
