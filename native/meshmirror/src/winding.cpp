// winding.cpp - Per-face winding reversal. Each iteration only touches its own
// face slot, so the loop is safe to run in parallel.

#include "winding.hpp"
#include <utility>

void reverse_winding(Mesh& mesh){
    mesh.discard_normals();
    const int nf = (int)mesh.faces.size();
#pragma omp parallel for
    for (int i = 0; i < nf; ++i)
        std::swap(mesh.faces[i].b, mesh.faces[i].c);
}

bool correct_winding(Mesh& mesh, int det_sign, bool& reversed, MirrorError& err){
    reversed = false;
    if (det_sign == 0) {
        err.kind = MirrorErrorKind::InvalidTransform;
        err.message = "winding correction called with determinant sign 0";
        return false;
    }
    if (det_sign < 0) {
        reverse_winding(mesh);
        reversed = true;
    } else {
        mesh.discard_normals();
    }
    return true;
}
