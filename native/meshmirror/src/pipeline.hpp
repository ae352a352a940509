// pipeline.hpp - Mirror pipeline: reflect, fix winding, recompute normals, validate.
//
// Stages run strictly in this order, each a function of the previous output
// plus the fixed transform:
//   Loaded -> Transformed -> WindingCorrected -> NormalsRecomputed -> Validated -> Done
//
// Fatal errors (InvalidTransform, InvalidMesh) are detected while still in
// Loaded, before any copy of the mesh is modified. Degenerate faces and
// consistency warnings accumulate in MirrorReport and never abort.
//
#pragma once
#include "mesh.hpp"
#include "errors.hpp"
#include "reflection.hpp"
#include "normals.hpp"
#include "validator.hpp"
#include <vector>

enum class PipelineStage {
    Loaded,
    Transformed,
    WindingCorrected,
    NormalsRecomputed,
    Validated,
    Done,
};

// Tuning knobs for a pipeline run. See src/main.cpp for CLI wiring.
struct MirrorOptions {
    NormalOptions normals;
    bool validate = true;   // run the consistency pass
    bool verbose = false;   // emit [cpp] stage lines on stderr
};

// Summary of one run, returned next to the corrected mesh.
struct MirrorReport {
    PipelineStage stage = PipelineStage::Loaded;  // last stage reached
    int  det_sign = 0;
    bool winding_reversed = false;
    size_t faces = 0;
    size_t verts = 0;
    std::vector<DegenerateFace> degenerate_faces;
    ConsistencyReport consistency;
};

struct MirrorResult {
    Mesh mesh;
    MirrorReport report;
};

// Run the pipeline on a private copy of `input`. `input` is never modified.
// Returns false and fills `err` on a fatal error; `out.report.stage` then
// names the stage at which it was detected.
bool mirror_mesh(const Mesh& input, const ReflectionTransform& t, const MirrorOptions& opt,
                 MirrorResult& out, MirrorError& err);

const char* stage_name(PipelineStage s);
