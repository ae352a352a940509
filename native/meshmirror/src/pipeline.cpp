// pipeline.cpp - Orchestration of the mirror stages.

#include "pipeline.hpp"
#include "winding.hpp"
#include <cstdio>
#include <utility>

static void log_stage(const MirrorOptions& opt, PipelineStage s, const MirrorReport& rep){
    if (!opt.verbose) return;
    fprintf(stderr, "[cpp] stage=%s faces=%zu verts=%zu det_sign=%d\n",
            stage_name(s), rep.faces, rep.verts, rep.det_sign);
}

bool mirror_mesh(const Mesh& input, const ReflectionTransform& t, const MirrorOptions& opt,
                 MirrorResult& out, MirrorError& err){
    // Work on locals so that `input` may safely alias `out.mesh`.
    MirrorReport rep;
    rep.faces = input.faces.size();
    rep.verts = input.verts.size();
    log_stage(opt, PipelineStage::Loaded, rep);

    // Loaded: both fatal checks before touching any geometry.
    if (!determinant_sign(t, rep.det_sign, err) || !validate_indices(input, err)) {
        if (opt.verbose) fprintf(stderr, "[cpp] %s: %s\n", error_kind_name(err.kind), err.message.c_str());
        out.report = rep;
        return false;
    }

    Mesh mesh;
    mesh.verts = input.verts;
    mesh.faces = input.faces;
    apply_reflection(mesh, t);
    rep.stage = PipelineStage::Transformed;
    log_stage(opt, rep.stage, rep);

    if (!correct_winding(mesh, rep.det_sign, rep.winding_reversed, err)) {
        out.report = rep;
        return false;
    }
    rep.stage = PipelineStage::WindingCorrected;
    log_stage(opt, rep.stage, rep);

    recompute_normals(mesh, opt.normals, rep.degenerate_faces);
    rep.stage = PipelineStage::NormalsRecomputed;
    if (opt.verbose) {
        for (auto& d : rep.degenerate_faces)
            fprintf(stderr, "[cpp] DegenerateFace: face=%d cross=%g longest_edge=%g\n", d.face, d.cross_length, d.longest_edge);
    }
    log_stage(opt, rep.stage, rep);

    if (opt.validate) rep.consistency = validate_consistency(mesh);
    rep.stage = PipelineStage::Validated;
    if (opt.verbose && !rep.consistency.clean()) {
        fprintf(stderr, "[cpp] consistency: boundary_edges=%zu non_manifold_edges=%zu duplicate_faces=%zu\n",
                rep.consistency.boundary_edges, rep.consistency.non_manifold_edges, rep.consistency.duplicate_faces);
    }
    log_stage(opt, rep.stage, rep);

    rep.stage = PipelineStage::Done;
    log_stage(opt, rep.stage, rep);
    out.mesh = std::move(mesh);
    out.report = std::move(rep);
    return true;
}

const char* stage_name(PipelineStage s){
    switch (s) {
        case PipelineStage::Loaded: return "Loaded";
        case PipelineStage::Transformed: return "Transformed";
        case PipelineStage::WindingCorrected: return "WindingCorrected";
        case PipelineStage::NormalsRecomputed: return "NormalsRecomputed";
        case PipelineStage::Validated: return "Validated";
        case PipelineStage::Done: return "Done";
    }
    return "Unknown";
}
