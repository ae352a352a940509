// mesh_fixtures.hpp - Small meshes and checks shared by the test executables.
#pragma once
#include "mesh.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

inline void check(bool cond, const std::string& what){
    if (!cond) throw std::runtime_error("Error, " + what);
}

inline bool near(double a, double b, double eps = 1e-9){ return std::fabs(a - b) <= eps; }

inline bool near(const Vec3& a, const Vec3& b, double eps = 1e-9){
    return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

// Unit cube [0,1]^3, 8 vertices, 12 outward-wound triangles.
// Faces 0-1 bottom, 2-3 top, 4-5 front (y=0), 6-7 back, 8-9 left (x=0), 10-11 right.
inline Mesh make_unit_cube(){
    Mesh m;
    m.verts = {{0,0,0},{1,0,0},{1,1,0},{0,1,0},{0,0,1},{1,0,1},{1,1,1},{0,1,1}};
    m.faces = {{0,2,1},{0,3,2}, {4,5,6},{4,6,7}, {0,1,5},{0,5,4},
               {3,7,6},{3,6,2}, {0,4,7},{0,7,3}, {1,2,6},{1,6,5}};
    return m;
}

// Unit cube with the two top faces removed: open along its 4 top edges.
inline Mesh make_open_box(){
    Mesh m = make_unit_cube();
    m.faces.erase(m.faces.begin() + 2, m.faces.begin() + 4);
    return m;
}

// Tetrahedron (0,0,0),(1,0,0),(0,2,0),(0,0,3), outward-wound, volume 1.
inline Mesh make_tetrahedron(){
    Mesh m;
    m.verts = {{0,0,0},{1,0,0},{0,2,0},{0,0,3}};
    m.faces = {{0,2,1},{0,1,3},{0,3,2},{1,2,3}};
    return m;
}

// Every face normal points away from `center`.
inline bool normals_point_away(const Mesh& m, const Vec3& center){
    if (!m.has_face_normals()) return false;
    for (size_t fi = 0; fi < m.faces.size(); ++fi) {
        if (dot3(m.face_normals[fi], sub(face_centroid(m, fi), center)) < 0.0) return false;
    }
    return true;
}
