#include "mesh_fixtures.hpp"
#include "mesh_io.hpp"
#include "pipeline.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <vector>

// Corner positions of face fi, in winding order.
static void corners(const Mesh& m, size_t fi, Vec3 out[3]){
  const Tri& f = m.faces[fi];
  out[0] = m.verts[f.a]; out[1] = m.verts[f.b]; out[2] = m.verts[f.c];
}

static void check_same_soup(const Mesh& a, const Mesh& b, double eps, const std::string& what){
  check(a.faces.size() == b.faces.size(), what + ": face count");
  for (size_t i = 0; i < a.faces.size(); ++i) {
    Vec3 ca[3], cb[3];
    corners(a, i, ca); corners(b, i, cb);
    for (int k = 0; k < 3; ++k) check(near(ca[k], cb[k], eps), what + ": corner mismatch at face " + std::to_string(i));
  }
}

// Binary STL from corner triples; `count` overrides the header triangle count.
static void write_binary_stl(const std::string& path, const std::vector<float>& corners, int count = -1){
  std::ofstream ofs(path, std::ios::binary);
  std::string header = "t06 binary";
  header.resize(80, '\0');
  ofs.write(header.data(), 80);
  uint32_t n = count < 0 ? (uint32_t)(corners.size() / 9) : (uint32_t)count;
  ofs.write(reinterpret_cast<const char*>(&n), 4);
  for (size_t t = 0; t + 9 <= corners.size(); t += 9) {
    const float normal[3] = {0, 0, 0};
    ofs.write(reinterpret_cast<const char*>(normal), 12);
    ofs.write(reinterpret_cast<const char*>(&corners[t]), 36);
    const uint16_t attr = 0;
    ofs.write(reinterpret_cast<const char*>(&attr), 2);
  }
}

static void write_text(const std::string& path, const std::string& text){
  std::ofstream ofs(path);
  ofs << text;
}

static const char* kFacet =
  "  facet normal 0 0 1\n    outer loop\n"
  "      vertex 0 0 0\n      vertex 1 0 0\n      vertex 0 1 0\n"
  "    endloop\n  endfacet\n";

int
main(int ac, char **av) {

  // Mirrored cube through binary and ASCII STL: welded back to 8 vertices, winding kept
  {
    // Arrange
    ReflectionTransform t; MirrorError merr; MirrorResult res;
    check(parse_reflection_spec("y", t, merr), "spec rejected");
    check(mirror_mesh(make_unit_cube(), t, MirrorOptions{}, res, merr), "pipeline failed");

    for (bool ascii : {false, true}) {
      const std::string path = ascii ? "t06_cube_ascii.stl" : "t06_cube_binary.stl";
      std::string err; Mesh loaded;

      // Act
      check(save_mesh(path, res.mesh, ascii, err), "save failed: " + err);
      check(load_mesh(path, loaded, err), "load failed: " + err);

      // Assert
      check(loaded.verts.size() == 8, path + ": vertices not welded");
      check_same_soup(res.mesh, loaded, 1e-6, path);
      check(validate_consistency(loaded).clean(), path + ": reloaded cube is not closed");
    }
  }

  // OBJ keeps indices and full precision, and writes vertex normals
  {
    Mesh mesh = make_tetrahedron();
    mesh.verts[1].x = 0.1234567890123456;
    std::vector<DegenerateFace> degenerate;
    recompute_normals(mesh, NormalOptions{}, degenerate);
    std::string err; Mesh loaded;
    check(save_mesh("t06_tet.obj", mesh, false, err), "obj save failed: " + err);
    check(load_mesh("t06_tet.obj", loaded, err), "obj load failed: " + err);
    check(loaded.verts.size() == 4 && loaded.faces.size() == 4, "obj counts");
    for (size_t i = 0; i < 4; ++i) {
      check(loaded.verts[i].x == mesh.verts[i].x && loaded.verts[i].y == mesh.verts[i].y && loaded.verts[i].z == mesh.verts[i].z, "obj vertex precision");
      check(loaded.faces[i].a == mesh.faces[i].a && loaded.faces[i].b == mesh.faces[i].b && loaded.faces[i].c == mesh.faces[i].c, "obj face indices");
    }
    check(!loaded.has_vertex_normals(), "loader must not carry normals");

    std::ifstream ifs("t06_tet.obj");
    std::string line; int vn = 0;
    while (std::getline(ifs, line)) if (line.compare(0, 3, "vn ") == 0) ++vn;
    check(vn == 4, "obj vn records");
  }

  // Negative OBJ indices and malformed records
  {
    {
      std::ofstream ofs("t06_rel.obj");
      ofs << "# relative indices\nv 0 0 0\nv 1 0 0\nv 0 1 0\nf -3 -2 -1\n";
    }
    Mesh m; std::string err;
    check(load_mesh("t06_rel.obj", m, err), "relative indices rejected: " + err);
    check(m.faces.size() == 1 && m.faces[0].a == 0 && m.faces[0].b == 1 && m.faces[0].c == 2, "relative indices resolved wrongly");

    {
      std::ofstream ofs("t06_quad.obj");
      ofs << "v 0 0 0\nv 1 0 0\nv 1 1 0\nv 0 1 0\nf 1 2 3 4\n";
    }
    check(!load_mesh("t06_quad.obj", m, err), "quad accepted");
    {
      std::ofstream ofs("t06_bad.obj");
      ofs << "v 0 0 0\nv 1 0 0\nv 1 1 0\nf 1 x 3\n";
    }
    check(!load_mesh("t06_bad.obj", m, err), "malformed face accepted");
    check(!load_mesh("t06_missing.obj", m, err), "missing file accepted");
    check(!load_mesh("t06_tet.ply", m, err), "unsupported extension accepted");
  }

  // Corrupt STL input fails the load instead of dropping or merging corners
  {
    Mesh m; std::string err;
    const float nan = std::numeric_limits<float>::quiet_NaN();

    // a NaN corner must not be welded onto a real vertex
    write_binary_stl("t06_nan.stl", {0,0,0, 1,0,0, 0,1,0,  nan,0,0, 2,0,0, 2,1,0});
    check(!load_mesh("t06_nan.stl", m, err), "NaN corner accepted");
    check(err.find("non-finite vertex at triangle 1") != std::string::npos, "NaN corner: unexpected message " + err);

    const float inf = std::numeric_limits<float>::infinity();
    write_binary_stl("t06_inf.stl", {0,0,0, 1,0,0, 0,inf,0});
    check(!load_mesh("t06_inf.stl", m, err), "infinite corner accepted");

    // header announces more triangles than the file holds
    write_binary_stl("t06_short.stl", {0,0,0, 1,0,0, 0,1,0}, 5);
    check(!load_mesh("t06_short.stl", m, err), "truncated binary STL accepted");
    check(err.find("truncated") != std::string::npos, "truncated binary: unexpected message " + err);

    // the well-formed ASCII facet itself loads
    write_text("t06_ok.stl", std::string("solid t\n") + kFacet + "endsolid t\n");
    check(load_mesh("t06_ok.stl", m, err), "valid ASCII facet rejected: " + err);
    check(m.faces.size() == 1 && m.verts.size() == 3, "valid ASCII facet counts");

    write_text("t06_two.stl", std::string("solid t\n") + kFacet +
      "  facet normal 0 0 1\n    outer loop\n      vertex 0 0 1\n      vertex 1 0 1\n    endloop\n  endfacet\nendsolid t\n");
    check(!load_mesh("t06_two.stl", m, err), "facet with 2 vertices accepted");

    write_text("t06_four.stl", std::string("solid t\n") +
      "  facet normal 0 0 1\n    outer loop\n      vertex 0 0 0\n      vertex 1 0 0\n"
      "      vertex 1 1 0\n      vertex 0 1 0\n    endloop\n  endfacet\nendsolid t\n");
    check(!load_mesh("t06_four.stl", m, err), "facet with 4 vertices accepted");

    write_text("t06_open_facet.stl", std::string("solid t\n") + kFacet +
      "  facet normal 0 0 1\n    outer loop\n      vertex 0 0 1\n      vertex 1 0 1\n");
    check(!load_mesh("t06_open_facet.stl", m, err), "unterminated facet accepted");
    check(err.find("unterminated facet") != std::string::npos, "unterminated facet: unexpected message " + err);

    write_text("t06_stray.stl", std::string("solid t\n") + kFacet + "  vertex 5 5 5\nendsolid t\n");
    check(!load_mesh("t06_stray.stl", m, err), "vertex outside outer loop accepted");
    check(err.find("outside outer loop") != std::string::npos, "stray vertex: unexpected message " + err);
  }

  // Output naming swaps left/right prefixes
  {
    check(mirrored_filename("L_arm.stl") == "R_arm.stl", "L_ -> R_");
    check(mirrored_filename("parts/r_leg_upper.stl") == "parts/l_leg_upper.stl", "r_ -> l_ keeps directory");
    check(mirrored_filename("R_hand.obj") == "L_hand.obj", "R_ -> L_");
    check(mirrored_filename("C:\\robot\\l_foot.STL") == "C:\\robot\\r_foot.STL", "backslash directory");
    check(mirrored_filename("dir/torso.stl") == "dir/mirrored_torso.stl", "no prefix -> mirrored_");
    check(mirrored_filename("L_/Lx.stl") == "L_/mirrored_Lx.stl", "prefix only checked on the file name");
  }

  std::cout << "t06-meshIO passed" << std::endl;
}
