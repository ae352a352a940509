//======================================================================
// Python bindings for the meshmirror pipeline.
//
// From Python the module looks like:
//   mirror(verts, faces, signs=None, matrix=None, plane=None, ...)
//       -> (verts, faces, face_normals, vertex_normals, report)
//   mass_properties(verts, faces, density) -> dict
//   mirrored_filename(path) -> str
//
// Exactly one of signs / matrix / plane may be given; with none of them the
// mesh is mirrored across y = 0 (left/right part mirror).
// Fatal pipeline errors are raised as ValueError carrying the kernel message.
//======================================================================

#include "mass_properties.hpp"
#include "mesh_io.hpp"
#include "pipeline.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

// Copy Python-side lists into a Mesh (pybind11 has already converted them).
static Mesh make_mesh(const std::vector<std::array<double, 3>>& verts,
                      const std::vector<std::array<int, 3>>& faces)
{
    Mesh mesh;
    mesh.verts.reserve(verts.size());
    for (const auto& v : verts) mesh.verts.push_back(Vec3{v[0], v[1], v[2]});
    mesh.faces.reserve(faces.size());
    for (const auto& f : faces) mesh.faces.push_back(Tri{f[0], f[1], f[2]});
    return mesh;
}

static std::vector<std::array<double, 3>> to_list(const std::vector<Vec3>& vs)
{
    std::vector<std::array<double, 3>> out;
    out.reserve(vs.size());
    for (const auto& v : vs) out.push_back({v.x, v.y, v.z});
    return out;
}

[[noreturn]] static void throw_mirror_error(const MirrorError& err)
{
    throw py::value_error(std::string(error_kind_name(err.kind)) + ": " + err.message);
}

//======================================================================
// mirror: build the transform from whichever spec was passed, run the
// pipeline, and hand back plain lists plus a report dict.
//======================================================================

static py::tuple mirror(
    const std::vector<std::array<double, 3>>& verts,
    const std::vector<std::array<int, 3>>& faces,
    py::object signs_obj,
    py::object matrix_obj,
    py::object plane_obj,
    double degenerate_eps,
    bool vertex_normals,
    const std::string& weighting,
    bool validate)
{
    int given = (!signs_obj.is_none()) + (!matrix_obj.is_none()) + (!plane_obj.is_none());
    if (given > 1) throw py::value_error("pass at most one of signs, matrix, plane");

    ReflectionTransform t;
    MirrorError err;
    bool ok = true;
    if (!signs_obj.is_none()) {
        auto s = signs_obj.cast<std::array<int, 3>>();
        ok = reflection_from_signs(s[0], s[1], s[2], t, err);
    } else if (!matrix_obj.is_none()) {
        // Accept a flat 9-list or a nested 3x3 list.
        std::array<double, 9> m{};
        if (py::len(matrix_obj) == 3) {
            auto rows = matrix_obj.cast<std::array<std::array<double, 3>, 3>>();
            for (int r = 0; r < 3; ++r) for (int c = 0; c < 3; ++c) m[3*r+c] = rows[r][c];
        } else {
            m = matrix_obj.cast<std::array<double, 9>>();
        }
        ok = reflection_from_matrix(m.data(), t, err);
    } else if (!plane_obj.is_none()) {
        auto n = plane_obj.cast<std::array<double, 3>>();
        ok = reflection_across_plane(Vec3{n[0], n[1], n[2]}, t, err);
    } else {
        ok = reflection_from_signs(1, -1, 1, t, err);
    }
    if (!ok) throw_mirror_error(err);

    MirrorOptions opt;
    opt.normals.degenerate_eps = degenerate_eps;
    opt.normals.vertex_normals = vertex_normals;
    bool wok = false;
    opt.normals.weighting = parse_weighting(weighting, wok);
    if (!wok) throw py::value_error("weighting must be 'area' or 'equal'");
    opt.validate = validate;

    Mesh mesh = make_mesh(verts, faces);
    MirrorResult res;
    if (!mirror_mesh(mesh, t, opt, res, err)) throw_mirror_error(err);

    std::vector<std::array<int, 3>> out_faces;
    out_faces.reserve(res.mesh.faces.size());
    for (const auto& f : res.mesh.faces) out_faces.push_back({f.a, f.b, f.c});

    const MirrorReport& rep = res.report;
    py::list degenerate;
    for (const auto& d : rep.degenerate_faces) degenerate.append(d.face);
    py::list warnings;
    for (const auto& w : rep.consistency.warnings) {
        py::dict wd;
        wd["kind"] = warning_kind_name(w.kind);
        wd["edge"] = w.kind == WarningKind::DuplicateFace ? py::object(py::none()) : py::object(py::make_tuple(w.v0, w.v1));
        wd["faces"] = w.faces;
        warnings.append(wd);
    }
    py::dict report;
    report["stage"] = stage_name(rep.stage);
    report["det_sign"] = rep.det_sign;
    report["winding_reversed"] = rep.winding_reversed;
    report["degenerate_faces"] = degenerate;
    report["warnings"] = warnings;

    py::object vn = res.mesh.has_vertex_normals() ? py::object(py::cast(to_list(res.mesh.vertex_normals))) : py::object(py::none());
    return py::make_tuple(to_list(res.mesh.verts), out_faces, to_list(res.mesh.face_normals), vn, report);
}

static py::dict mass_properties(
    const std::vector<std::array<double, 3>>& verts,
    const std::vector<std::array<int, 3>>& faces,
    double density)
{
    Mesh mesh = make_mesh(verts, faces);
    MirrorError merr;
    if (!validate_indices(mesh, merr)) throw_mirror_error(merr);
    MassProperties mp;
    std::string err;
    if (!compute_mass_properties(mesh, density, mp, err)) throw py::value_error(err);
    py::dict d;
    d["volume"] = mp.volume;
    d["mass"] = mp.mass;
    d["center_of_mass"] = py::make_tuple(mp.center_of_mass.x, mp.center_of_mass.y, mp.center_of_mass.z);
    d["inertia"] = std::vector<double>(mp.inertia, mp.inertia + 9);
    return d;
}

PYBIND11_MODULE(meshmirror_py, m) {
    m.doc() = "Python bindings for the native meshmirror reflection / winding-correction pipeline";

    m.def(
        "mirror",
        &mirror,
        py::arg("verts"),
        py::arg("faces"),
        py::arg("signs") = py::none(),
        py::arg("matrix") = py::none(),
        py::arg("plane") = py::none(),
        py::arg("degenerate_eps") = 1e-12,
        py::arg("vertex_normals") = true,
        py::arg("weighting") = "area",
        py::arg("validate") = true,
        R"doc(
Mirror a triangle mesh and correct its winding and normals.

Parameters
----------
verts : List[(x,y,z)]
    Vertex positions as double triples.
faces : List[(i,j,k)]
    Triangle indices (0-based), consistently wound.
signs : Optional[(sx,sy,sz)]
    Per-axis signs, each +1 or -1.
matrix : Optional[9 floats or 3x3 nested list]
    Explicit linear map (row-major). Must be non-singular.
plane : Optional[(nx,ny,nz)]
    Normal of the mirror plane through the origin.
degenerate_eps : float
    Relative area threshold below which a face is reported degenerate.
vertex_normals : bool
    Also compute smoothed per-vertex normals.
weighting : str
    'area' or 'equal' vertex normal weighting.
validate : bool
    Run the boundary / non-manifold / duplicate-face diagnostics.

Returns
-------
verts, faces, face_normals, vertex_normals_or_None, report : dict

Raises
------
ValueError
    On a singular transform or an out-of-range face index.
        )doc");

    m.def("mass_properties", &mass_properties, py::arg("verts"), py::arg("faces"), py::arg("density") = 1.0,
          "Signed volume, mass, center of mass and inertia (row-major 3x3, about the center of mass).");

    m.def("mirrored_filename", &mirrored_filename, py::arg("path"),
          "Swap an L_/R_ (or l_/r_) prefix, or prepend 'mirrored_'.");
}
