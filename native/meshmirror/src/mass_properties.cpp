// mass_properties.cpp - Divergence-theorem integrals over origin-based tetrahedra.
//
// Pass 1: signed volume and first moment -> center of mass.
// Pass 2: second moments about the center of mass,
//   C_ab = sum det/120 * sum_{j,k} (1 + delta_jk) p_j[a] p_k[b]
// with p_j the face corners relative to the center of mass and
// det = p0 . (p1 x p2). Then I = density * (trace(C) * Id - C).

#include "mass_properties.hpp"
#include <cmath>

bool compute_mass_properties(const Mesh& mesh, double density, MassProperties& out, std::string& err){
    out = MassProperties{};
    if (mesh.faces.empty()) { err = "mass properties: mesh has no faces"; return false; }

    double vol6 = 0.0;
    Vec3 moment;
    for (auto& f : mesh.faces) {
        const Vec3& p0 = mesh.verts[f.a];
        const Vec3& p1 = mesh.verts[f.b];
        const Vec3& p2 = mesh.verts[f.c];
        double det = dot3(p0, cross(p1, p2));
        vol6 += det;
        moment = add(moment, scale(add(add(p0, p1), p2), det / 4.0));
    }
    if (vol6 == 0.0 || !std::isfinite(vol6)) { err = "mass properties: mesh encloses zero volume"; return false; }

    out.volume = vol6 / 6.0;
    out.mass = density * out.volume;
    out.center_of_mass = scale(moment, 1.0 / vol6);

    double C[9] = {0,0,0, 0,0,0, 0,0,0};
    for (auto& f : mesh.faces) {
        Vec3 q[3] = {sub(mesh.verts[f.a], out.center_of_mass),
                     sub(mesh.verts[f.b], out.center_of_mass),
                     sub(mesh.verts[f.c], out.center_of_mass)};
        double det = dot3(q[0], cross(q[1], q[2]));
        double p[3][3];
        for (int j = 0; j < 3; ++j) { p[j][0] = q[j].x; p[j][1] = q[j].y; p[j][2] = q[j].z; }
        for (int a = 0; a < 3; ++a) {
            for (int b = a; b < 3; ++b) {
                double val = 0.0;
                for (int j = 0; j < 3; ++j)
                    for (int k = 0; k < 3; ++k)
                        val += (j == k ? 2.0 : 1.0) * p[j][a] * p[k][b];
                double term = det / 120.0 * val;
                C[3*a+b] += term;
                if (a != b) C[3*b+a] += term;
            }
        }
    }

    double tr = C[0] + C[4] + C[8];
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            double v = density * ((r == c ? tr : 0.0) - C[3*r+c]);
            out.inertia[3*r+c] = std::fabs(v) < kInertiaEpsilon ? 0.0 : v;
        }
    }
    return true;
}
