// mesh.hpp - Triangle-only mesh container used by the meshmirror kernel.
//
// Conventions used across meshmirror:
// - Triangle-only: all faces are 3 indices (Tri). Non-tri meshes must be pre-triangulated.
// - Indices are 0-based in memory (OBJ uses 1-based; we convert in I/O layer).
// - Winding is meaningful: the normal of face (a,b,c) is (b-a)x(c-a).
// - Normals are derived data. Whenever positions or winding change they are
//   dropped and recomputed, never carried over.
//
#pragma once
#include <vector>
#include <array>
#include <string>
#include <cmath>

struct MirrorError;

// 3D point/vector. We use a plain struct for cache-friendly access.
struct Vec3 { double x{}, y{}, z{}; };

// Triangle face made of 3 vertex indices (0-based).
struct Tri { int a{}, b{}, c{}; };

inline Vec3 sub(const Vec3& a, const Vec3& b){ return {a.x-b.x, a.y-b.y, a.z-b.z}; }
inline Vec3 add(const Vec3& a, const Vec3& b){ return {a.x+b.x, a.y+b.y, a.z+b.z}; }
inline Vec3 scale(const Vec3& a, double s){ return {a.x*s, a.y*s, a.z*s}; }
inline Vec3 cross(const Vec3& a, const Vec3& b){ return {a.y*b.z-a.z*b.y, a.z*b.x-a.x*b.z, a.x*b.y-a.y*b.x}; }
inline double dot3(const Vec3& a, const Vec3& b){ return a.x*b.x+a.y*b.y+a.z*b.z; }
inline double len3(const Vec3& a){ return std::sqrt(dot3(a,a)); }

struct Mesh {
    // Vertex positions (units agnostic; typically scene units in STL/OBJ).
    std::vector<Vec3> verts;
    // Triangle faces. Each entry is a 3-tuple of indices into verts.
    std::vector<Tri>  faces;

    // Optional per-face unit normals, same length/order as faces when present.
    // Degenerate faces carry a zero vector.
    std::vector<Vec3> face_normals;
    // Optional per-vertex smoothed normals, same length/order as verts when present.
    std::vector<Vec3> vertex_normals;

    // Clear all geometry. Does not shrink capacity (standard vector behavior).
    void clear();

    // Drop derived normals. Called whenever positions or winding change.
    void discard_normals();

    bool has_face_normals() const { return !faces.empty() && face_normals.size() == faces.size(); }
    bool has_vertex_normals() const { return !verts.empty() && vertex_normals.size() == verts.size(); }

    // Convenience counters.
    size_t num_faces() const { return faces.size(); }
    size_t num_verts() const { return verts.size(); }
};

// Check that every face index lies in [0, num_verts). On the first violation
// returns false and fills `err` with kind InvalidMesh, the face index, the
// offending corner and value.
bool validate_indices(const Mesh& mesh, MirrorError& err);

// Arithmetic mean of all vertex positions; zero for an empty mesh.
Vec3 vertex_centroid(const Mesh& mesh);

// Centroid of face `fi` (mean of its three corners).
Vec3 face_centroid(const Mesh& mesh, size_t fi);
