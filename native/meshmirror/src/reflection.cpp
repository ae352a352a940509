// reflection.cpp - Construction, validation and application of reflection transforms.

#include "reflection.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

static bool fail_transform(MirrorError& err, const std::string& msg){
    err.kind = MirrorErrorKind::InvalidTransform;
    err.face = -1; err.corner = -1; err.value = 0;
    err.message = msg;
    return false;
}

// Split "a,b,c" into doubles. Returns false on any malformed token.
static bool parse_doubles(const std::string& s, std::vector<double>& out){
    out.clear();
    std::string tok; std::istringstream iss(s);
    while (std::getline(iss, tok, ',')) {
        size_t used = 0; double v = 0.0;
        try { v = std::stod(tok, &used); }
        catch (const std::invalid_argument&) { return false; }
        catch (const std::out_of_range&) { return false; }
        while (used < tok.size() && (tok[used]==' ' || tok[used]=='\t')) ++used;
        if (used != tok.size()) return false;
        out.push_back(v);
    }
    return true;
}

ReflectionTransform identity_transform(){
    return ReflectionTransform{{1,0,0, 0,1,0, 0,0,1}};
}

double determinant(const ReflectionTransform& t){
    const double* m = t.m;
    return m[0]*(m[4]*m[8]-m[5]*m[7])
         - m[1]*(m[3]*m[8]-m[5]*m[6])
         + m[2]*(m[3]*m[7]-m[4]*m[6]);
}

std::string format_transform(const ReflectionTransform& t){
    std::ostringstream oss;
    for (int r = 0; r < 3; ++r) {
        if (r) oss << "; ";
        oss << t.m[3*r] << ' ' << t.m[3*r+1] << ' ' << t.m[3*r+2];
    }
    return oss.str();
}

bool determinant_sign(const ReflectionTransform& t, int& sign, MirrorError& err){
    for (double v : t.m) {
        if (!std::isfinite(v)) return fail_transform(err, "non-finite matrix entry in [" + format_transform(t) + "]");
    }
    // Dividing each row by its largest magnitude keeps the sign and keeps the
    // cofactor products away from overflow and underflow.
    ReflectionTransform u = t;
    for (int r = 0; r < 3; ++r) {
        double* row = u.m + 3*r;
        double mx = std::max(std::fabs(row[0]), std::max(std::fabs(row[1]), std::fabs(row[2])));
        if (mx == 0.0) return fail_transform(err, "singular transform [" + format_transform(t) + "] has determinant 0");
        for (int c = 0; c < 3; ++c) row[c] /= mx;
    }
    double d = determinant(u);
    if (d == 0.0) return fail_transform(err, "singular transform [" + format_transform(t) + "] has determinant 0");
    sign = d > 0.0 ? 1 : -1;
    return true;
}

bool reflection_from_signs(int sx, int sy, int sz, ReflectionTransform& out, MirrorError& err){
    const int s[3] = {sx, sy, sz};
    for (int k = 0; k < 3; ++k) {
        if (s[k] == 1 || s[k] == -1) continue;
        std::ostringstream oss;
        oss << "sign triple {" << sx << "," << sy << "," << sz << "} entry " << "xyz"[k] << " must be +1 or -1";
        return fail_transform(err, oss.str());
    }
    out = ReflectionTransform{{(double)sx,0,0, 0,(double)sy,0, 0,0,(double)sz}};
    return true;
}

bool reflection_from_matrix(const double m[9], ReflectionTransform& out, MirrorError& err){
    ReflectionTransform t;
    for (int i = 0; i < 9; ++i) t.m[i] = m[i];
    int sign = 0;
    if (!determinant_sign(t, sign, err)) return false;
    out = t;
    return true;
}

bool reflection_across_plane(const Vec3& n, ReflectionTransform& out, MirrorError& err){
    double n2 = dot3(n, n);
    if (!std::isfinite(n2) || n2 == 0.0) {
        std::ostringstream oss;
        oss << "plane normal (" << n.x << "," << n.y << "," << n.z << ") has zero length";
        return fail_transform(err, oss.str());
    }
    const double v[3] = {n.x, n.y, n.z};
    ReflectionTransform t;
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 3; ++c)
            t.m[3*r+c] = (r==c ? 1.0 : 0.0) - 2.0*v[r]*v[c]/n2;
    out = t;
    return true;
}

bool parse_reflection_spec(const std::string& spec, ReflectionTransform& out, MirrorError& err){
    size_t colon = spec.find(':');
    if (colon == std::string::npos) {
        // Axis letters: each named axis is negated once.
        if (spec.empty()) return fail_transform(err, "empty reflection spec");
        int s[3] = {1, 1, 1};
        bool seen[3] = {false, false, false};
        for (char ch : spec) {
            int k = (ch=='x'||ch=='X') ? 0 : (ch=='y'||ch=='Y') ? 1 : (ch=='z'||ch=='Z') ? 2 : -1;
            if (k < 0 || seen[k]) return fail_transform(err, "bad axis spec '" + spec + "' (expected letters from x,y,z)");
            seen[k] = true; s[k] = -1;
        }
        return reflection_from_signs(s[0], s[1], s[2], out, err);
    }

    std::string kind = spec.substr(0, colon);
    std::vector<double> vals;
    if (!parse_doubles(spec.substr(colon+1), vals)) return fail_transform(err, "malformed numbers in reflection spec '" + spec + "'");

    if (kind == "signs") {
        if (vals.size() != 3) return fail_transform(err, "signs: expects 3 values, got '" + spec + "'");
        for (double v : vals) {
            if (v != 1.0 && v != -1.0) return fail_transform(err, "signs: entries must be +1 or -1, got '" + spec + "'");
        }
        return reflection_from_signs((int)vals[0], (int)vals[1], (int)vals[2], out, err);
    }
    if (kind == "plane") {
        if (vals.size() != 3) return fail_transform(err, "plane: expects 3 values, got '" + spec + "'");
        return reflection_across_plane(Vec3{vals[0], vals[1], vals[2]}, out, err);
    }
    if (kind == "matrix") {
        if (vals.size() != 9) return fail_transform(err, "matrix: expects 9 values, got '" + spec + "'");
        return reflection_from_matrix(vals.data(), out, err);
    }
    return fail_transform(err, "unknown reflection spec kind '" + kind + "'");
}

Vec3 reflect_point(const ReflectionTransform& t, const Vec3& p){
    const double* m = t.m;
    return { m[0]*p.x + m[1]*p.y + m[2]*p.z,
             m[3]*p.x + m[4]*p.y + m[5]*p.z,
             m[6]*p.x + m[7]*p.y + m[8]*p.z };
}

void apply_reflection(Mesh& mesh, const ReflectionTransform& t){
    mesh.discard_normals();
    const int nv = (int)mesh.verts.size();
#pragma omp parallel for
    for (int i = 0; i < nv; ++i)
        mesh.verts[i] = reflect_point(t, mesh.verts[i]);
}

void reflect_inertia(const ReflectionTransform& t, const double I[9], double out[9]){
    // MI = M * I, then out = MI * M^T
    double MI[9];
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 3; ++c)
            MI[3*r+c] = t.m[3*r]*I[c] + t.m[3*r+1]*I[3+c] + t.m[3*r+2]*I[6+c];
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 3; ++c)
            out[3*r+c] = MI[3*r]*t.m[3*c] + MI[3*r+1]*t.m[3*c+1] + MI[3*r+2]*t.m[3*c+2];
}
