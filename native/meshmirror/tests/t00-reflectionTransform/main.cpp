#include "mesh_fixtures.hpp"
#include "reflection.hpp"
#include <cmath>
#include <iostream>
#include <limits>

int
main(int ac, char **av) {

  // Sign triples: determinant sign is the product of the signs
  {
    const int triples[8][3] = {{1,1,1},{-1,1,1},{1,-1,1},{1,1,-1},{-1,-1,1},{-1,1,-1},{1,-1,-1},{-1,-1,-1}};
    for (auto& s : triples) {
      // Arrange
      ReflectionTransform t; MirrorError err;
      check(reflection_from_signs(s[0], s[1], s[2], t, err), "valid sign triple rejected");

      // Act
      int sign = 0;
      bool ok = determinant_sign(t, sign, err);

      // Assert
      check(ok, "determinant_sign failed on sign triple");
      check(sign == s[0]*s[1]*s[2], "determinant sign differs from sign product");
    }
  }

  // Sign triple entries other than +-1 are rejected
  {
    ReflectionTransform t; MirrorError err;
    check(!reflection_from_signs(1, 0, 1, t, err), "zero sign accepted");
    check(err.kind == MirrorErrorKind::InvalidTransform, "wrong error kind for zero sign");
    err.clear();
    check(!reflection_from_signs(1, -2, 1, t, err), "scaling sign accepted");
    check(err.kind == MirrorErrorKind::InvalidTransform, "wrong error kind for -2 sign");
  }

  // Singular and non-finite matrices fail with InvalidTransform
  {
    // Arrange
    const double singular[9] = {1,0,0, 0,0,0, 0,0,1};
    const double rank2[9] = {1,2,3, 2,4,6, 0,0,1};
    double nan_m[9] = {1,0,0, 0,1,0, 0,0,1};
    nan_m[4] = std::numeric_limits<double>::quiet_NaN();
    ReflectionTransform t = identity_transform(); MirrorError err;

    // Act / Assert
    check(!reflection_from_matrix(singular, t, err), "singular matrix accepted");
    check(err.kind == MirrorErrorKind::InvalidTransform, "singular: wrong error kind");
    check(err.message.find("determinant 0") != std::string::npos, "singular: message lacks determinant");
    err.clear();
    check(!reflection_from_matrix(rank2, t, err), "rank-2 matrix accepted");
    err.clear();
    check(!reflection_from_matrix(nan_m, t, err), "NaN matrix accepted");
    check(err.kind == MirrorErrorKind::InvalidTransform, "NaN: wrong error kind");

    // a rejected matrix leaves `out` untouched
    check(t.m[0] == 1 && t.m[4] == 1 && t.m[8] == 1, "rejected matrix overwrote output");
  }

  // Very small or very large but regular matrices keep their sign
  {
    // Arrange
    const double tiny[9] = {1e-110,0,0, 0,1e-110,0, 0,0,-1e-110};
    const double huge[9] = {1e110,0,0, 0,1e110,0, 0,0,1e110};
    const double mixed[9] = {1e-200,0,0, 0,1e200,0, 0,0,-1};
    ReflectionTransform t; MirrorError err; int sign = 0;

    // Act / Assert
    check(reflection_from_matrix(tiny, t, err), "tiny regular matrix rejected: " + err.message);
    check(determinant_sign(t, sign, err) && sign == -1, "tiny matrix det sign is not -1");
    check(reflection_from_matrix(huge, t, err), "huge regular matrix rejected: " + err.message);
    check(determinant_sign(t, sign, err) && sign == 1, "huge matrix det sign is not +1");
    check(reflection_from_matrix(mixed, t, err), "mixed-scale matrix rejected: " + err.message);
    check(determinant_sign(t, sign, err) && sign == -1, "mixed-scale det sign is not -1");
  }

  // Rotations keep det +1, general negative-det maps give -1
  {
    const double rot_z90[9] = {0,-1,0, 1,0,0, 0,0,1};
    const double skew_flip[9] = {2,0.5,0, 0,-3,0, 0,1,0.5};
    ReflectionTransform t; MirrorError err; int sign = 0;
    check(reflection_from_matrix(rot_z90, t, err), "rotation rejected");
    check(determinant_sign(t, sign, err) && sign == 1, "rotation det sign is not +1");
    check(near(determinant(t), 1.0), "rotation determinant is not 1");
    check(reflection_from_matrix(skew_flip, t, err), "skew flip rejected");
    check(determinant_sign(t, sign, err) && sign == -1, "skew flip det sign is not -1");
    check(near(determinant(t), -3.0), "skew flip determinant is not -3");
  }

  // Plane reflection: y-normal equals the {1,-1,1} triple; oblique plane is an involution
  {
    ReflectionTransform p, s; MirrorError err;
    check(reflection_across_plane(Vec3{0,2,0}, p, err), "y plane rejected");
    check(reflection_from_signs(1, -1, 1, s, err), "sign triple rejected");
    for (int i = 0; i < 9; ++i) check(near(p.m[i], s.m[i]), "y plane differs from sign triple");

    ReflectionTransform q;
    check(reflection_across_plane(Vec3{1,1,0}, q, err), "oblique plane rejected");
    int sign = 0;
    check(determinant_sign(q, sign, err) && sign == -1, "oblique plane det sign is not -1");
    Vec3 v{0.3, -1.7, 2.5};
    check(near(reflect_point(q, reflect_point(q, v)), v), "plane reflection is not an involution");
    check(near(reflect_point(q, Vec3{1,-1,4}), Vec3{1,-1,4}), "point on the plane moved");
    check(near(reflect_point(q, Vec3{1,1,0}), Vec3{-1,-1,0}), "normal was not negated");

    err.clear();
    check(!reflection_across_plane(Vec3{0,0,0}, q, err), "zero plane normal accepted");
    check(err.kind == MirrorErrorKind::InvalidTransform, "zero normal: wrong error kind");
  }

  // Textual specs
  {
    ReflectionTransform t; MirrorError err; int sign = 0;
    check(parse_reflection_spec("y", t, err), "'y' rejected");
    check(t.m[0] == 1 && t.m[4] == -1 && t.m[8] == 1, "'y' is not diag(1,-1,1)");
    check(parse_reflection_spec("xz", t, err) && determinant_sign(t, sign, err) && sign == 1, "'xz' det sign is not +1");
    check(parse_reflection_spec("XYZ", t, err) && determinant_sign(t, sign, err) && sign == -1, "'XYZ' det sign is not -1");
    check(parse_reflection_spec("signs:-1,1,1", t, err) && t.m[0] == -1, "'signs:' not parsed");
    check(parse_reflection_spec("plane:0,0,1", t, err) && near(t.m[8], -1.0), "'plane:' not parsed");
    check(parse_reflection_spec("matrix:1,0,0,0,-1,0,0,0,1", t, err) && t.m[4] == -1, "'matrix:' not parsed");

    const char* bad[] = {"", "q", "yy", "signs:1,-1", "signs:1,0.5,1", "plane:0,0,0",
                         "matrix:1,2,3", "matrix:1,0,0,0,0,0,0,0,1", "rotate:1,2,3", "signs:1,abc,1"};
    for (const char* s : bad) {
      err.clear();
      check(!parse_reflection_spec(s, t, err), std::string("accepted bad spec '") + s + "'");
      check(err.kind == MirrorErrorKind::InvalidTransform, std::string("wrong error kind for '") + s + "'");
    }
  }

  // Inertia under a y mirror: xy and yz products flip, xz stays
  {
    ReflectionTransform t; MirrorError err;
    check(reflection_from_signs(1, -1, 1, t, err), "sign triple rejected");
    const double I[9] = {2,0.3,0.1, 0.3,3,0.2, 0.1,0.2,4};
    double out[9];
    reflect_inertia(t, I, out);
    const double expected[9] = {2,-0.3,0.1, -0.3,3,-0.2, 0.1,-0.2,4};
    for (int i = 0; i < 9; ++i) check(near(out[i], expected[i]), "mirrored inertia entry mismatch");
  }

  std::cout << "t00-reflectionTransform passed" << std::endl;
}
