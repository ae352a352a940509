// reflection.hpp - Linear reflection transforms and their determinant sign.
//
// A ReflectionTransform is a plain 3x3 matrix, row-major, applied as p' = M p.
// The only property the rest of the pipeline depends on is the sign of det(M),
// which is always computed algebraically from the entries.
//
#pragma once
#include "mesh.hpp"
#include "errors.hpp"
#include <string>

struct ReflectionTransform { double m[9]; };

// Identity (det = +1). Useful as a neutral starting point for callers.
ReflectionTransform identity_transform();

// Per-axis sign triple, e.g. {1,-1,1} mirrors across the plane y = 0.
// Each entry must be exactly +1 or -1.
bool reflection_from_signs(int sx, int sy, int sz, ReflectionTransform& out, MirrorError& err);

// Explicit row-major 3x3 matrix. Rejected when singular or non-finite.
bool reflection_from_matrix(const double m[9], ReflectionTransform& out, MirrorError& err);

// Householder reflection across the plane through the origin with normal n:
// M = I - 2 n n^T / |n|^2. Rejected when n has zero length.
bool reflection_across_plane(const Vec3& n, ReflectionTransform& out, MirrorError& err);

// Parse a textual reflection spec:
//   "x" / "y" / "z" / "xy" / "xyz" ...     axis letters to negate
//   "signs:1,-1,1"                         per-axis sign triple
//   "plane:nx,ny,nz"                       plane normal
//   "matrix:m00,m01,...,m22"               explicit 9 values
bool parse_reflection_spec(const std::string& spec, ReflectionTransform& out, MirrorError& err);

// det(M) by cofactor expansion along the first row.
double determinant(const ReflectionTransform& t);

// +1 or -1 on success. Fails with InvalidTransform when det(M) is exactly zero
// or any entry is not finite.
bool determinant_sign(const ReflectionTransform& t, int& sign, MirrorError& err);

// p' = M p
Vec3 reflect_point(const ReflectionTransform& t, const Vec3& p);

// Apply M to every vertex of `mesh` in place. Derived normals are discarded.
void apply_reflection(Mesh& mesh, const ReflectionTransform& t);

// Rotational inertia tensor under the map: I' = M I M^T (row-major 3x3).
// Exact for orthogonal M (all reflections built above).
void reflect_inertia(const ReflectionTransform& t, const double I[9], double out[9]);

// "m00 m01 m02; m10 ..." for log lines and error messages.
std::string format_transform(const ReflectionTransform& t);
