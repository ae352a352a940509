// mass_properties.hpp - Volume, center of mass and inertia of a closed triangle mesh.
//
// Integrals are evaluated with the divergence theorem over the tetrahedra
// (origin, a, b, c), so every quantity is signed by the face winding: an
// outward-wound closed mesh has positive volume, an inside-out one negative.
// This makes volume a cheap end-to-end check that a mirror kept the mesh
// outward-facing.
//
#pragma once
#include "mesh.hpp"
#include <string>

struct MassProperties {
    double volume = 0.0;     // signed
    double mass = 0.0;       // density * volume
    Vec3   center_of_mass;
    double inertia[9] = {0,0,0, 0,0,0, 0,0,0}; // about center_of_mass, row-major, symmetric
};

// Entries with magnitude below this are flushed to zero in the inertia tensor.
constexpr double kInertiaEpsilon = 1e-10;

// Fails when the mesh is empty or encloses exactly zero (or non-finite) volume.
bool compute_mass_properties(const Mesh& mesh, double density, MassProperties& out, std::string& err);
