// winding.hpp - Determinant-driven face winding correction.
//
// The decision to flip is taken from the transform's determinant sign alone;
// no geometric "is this closed / which side is outside" test is involved, so
// open, self-intersecting and non-manifold meshes are treated exactly like
// closed ones.
//
#pragma once
#include "mesh.hpp"
#include "errors.hpp"

// Rewrite every face (a,b,c) -> (a,c,b). Vertex set and topology are kept;
// only the orientation flips. Cached normals are discarded.
void reverse_winding(Mesh& mesh);

// det_sign < 0: reverse_winding and set `reversed` to true.
// det_sign > 0: faces unchanged, `reversed` false.
// det_sign == 0: InvalidTransform (a singular transform must be rejected upstream).
// Normals are discarded in every successful case since positions changed.
bool correct_winding(Mesh& mesh, int det_sign, bool& reversed, MirrorError& err);
