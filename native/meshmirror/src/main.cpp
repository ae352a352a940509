// main.cpp - Command-line wrapper around the mirror pipeline.
//
// Responsibilities:
// - Parse minimal flags (in/out, reflection, normal options, validation, output format).
// - Load input OBJ/STL, run mirror_mesh, and save the corrected mesh.
// - Print a short summary to stdout so the Python adapter can parse it.

#include "mass_properties.hpp"
#include "mesh_io.hpp"
#include "pipeline.hpp"
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

static void usage(){
    fprintf(stderr, "meshmirror (v%s)\n", MMR_VERSION);
    fprintf(stderr, "Usage: meshmirror --in in.stl|in.obj [--out out.stl|out.obj]\n"
                    "                  [--axis x|y|z|xy|... | --signs sx,sy,sz | --plane nx,ny,nz | --matrix m00,...,m22]\n"
                    "                  [--eps e] [--weighting area|equal] [--no-vertex-normals] [--no-validate]\n"
                    "                  [--ascii] [--mass-density d] [--quiet]\n");
}

static bool parse_double(const char* s, double& out){
    size_t used = 0;
    try { out = std::stod(s, &used); }
    catch (const std::invalid_argument&) { return false; }
    catch (const std::out_of_range&) { return false; }
    return used == std::strlen(s);
}

static void print_matrix(const char* label, const double m[9]){
    fprintf(stdout, "%s: %.8f %.8f %.8f; %.8f %.8f %.8f; %.8f %.8f %.8f\n",
            label, m[0], m[1], m[2], m[3], m[4], m[5], m[6], m[7], m[8]);
}

int main(int argc, char** argv){
    const char* in_path=nullptr; const char* out_path=nullptr;
    std::string reflection = "y"; // left/right parts are mirrored across y = 0
    MirrorOptions opt; opt.verbose = true;
    bool stl_ascii = false;
    double density = -1.0;
    for(int i=1;i<argc;i++){
        if(!strcmp(argv[i],"--in") && i+1<argc) in_path=argv[++i];
        else if(!strcmp(argv[i],"--out") && i+1<argc) out_path=argv[++i];
        else if(!strcmp(argv[i],"--axis") && i+1<argc) reflection=argv[++i];
        else if(!strcmp(argv[i],"--signs") && i+1<argc) reflection=std::string("signs:")+argv[++i];
        else if(!strcmp(argv[i],"--plane") && i+1<argc) reflection=std::string("plane:")+argv[++i];
        else if(!strcmp(argv[i],"--matrix") && i+1<argc) reflection=std::string("matrix:")+argv[++i];
        else if(!strcmp(argv[i],"--eps") && i+1<argc){
            if(!parse_double(argv[++i], opt.normals.degenerate_eps) || opt.normals.degenerate_eps<0){ fprintf(stderr, "Bad --eps value: %s\n", argv[i]); return 2; }
        }
        else if(!strcmp(argv[i],"--weighting") && i+1<argc){
            bool ok=false; opt.normals.weighting=parse_weighting(argv[++i], ok);
            if(!ok){ fprintf(stderr, "Bad --weighting value: %s\n", argv[i]); usage(); return 2; }
        }
        else if(!strcmp(argv[i],"--mass-density") && i+1<argc){
            if(!parse_double(argv[++i], density) || density<=0){ fprintf(stderr, "Bad --mass-density value: %s\n", argv[i]); return 2; }
        }
        else if(!strcmp(argv[i],"--no-vertex-normals")) opt.normals.vertex_normals=false;
        else if(!strcmp(argv[i],"--no-validate")) opt.validate=false;
        else if(!strcmp(argv[i],"--ascii")) stl_ascii=true;
        else if(!strcmp(argv[i],"--quiet")) opt.verbose=false;
        else { fprintf(stderr, "Unknown or incomplete option: %s\n", argv[i]); usage(); return 2; }
    }
    if(!in_path){ usage(); return 2; }
    std::string out_file = out_path ? std::string(out_path) : mirrored_filename(in_path);

    ReflectionTransform t; MirrorError merr;
    if(!parse_reflection_spec(reflection, t, merr)){ fprintf(stderr, "%s: %s\n", error_kind_name(merr.kind), merr.message.c_str()); usage(); return 2; }

    Mesh mesh; std::string err;
    if(!load_mesh(in_path, mesh, err)){ fprintf(stderr, "Load error: %s\n", err.c_str()); return 3; }
    if(opt.verbose) fprintf(stderr, "[cpp] source=%s transform=[%s]\n", in_path, format_transform(t).c_str());

    MirrorResult res;
    if(!mirror_mesh(mesh, t, opt, res, merr)){
        fprintf(stderr, "Mirror failed (%s at stage %s): %s\n", error_kind_name(merr.kind), stage_name(res.report.stage), merr.message.c_str());
        return 4;
    }

    if(!save_mesh(out_file, res.mesh, stl_ascii, err)){ fprintf(stderr, "Save error: %s\n", err.c_str()); return 5; }

    // The summary lines are parsed by the Python adapter; avoid extra stdout noise here.
    const MirrorReport& rep = res.report;
    fprintf(stdout, "out: %s\nfaces: %zu\nverts: %zu\ndet_sign: %d\nreversed: %d\ndegenerate: %zu\nwarnings: %zu\n",
            out_file.c_str(), res.mesh.num_faces(), res.mesh.num_verts(), rep.det_sign, rep.winding_reversed ? 1 : 0,
            rep.degenerate_faces.size(), rep.consistency.warnings.size());

    if(density>0){
        MassProperties mp;
        if(!compute_mass_properties(res.mesh, density, mp, err)){ fprintf(stderr, "Mass properties: %s\n", err.c_str()); return 4; }
        fprintf(stdout, "volume: %.12f\nmass: %.12f\ncenter_of_mass: %.6f %.6f %.6f\n",
                mp.volume, mp.mass, mp.center_of_mass.x, mp.center_of_mass.y, mp.center_of_mass.z);
        print_matrix("inertia", mp.inertia);
    }
    return 0;
}
