// io_stl.cpp - STL reader/writer with exact-position vertex welding.

#include "io_stl.hpp"
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <map>

namespace {

bool finite_point(const Vec3& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

// Maps exact positions to vertex indices while a soup is being read.
struct Welder {
    Mesh& mesh;
    std::map<std::array<double,3>, int> index;

    explicit Welder(Mesh& m) : mesh(m) {}

    int add(const Vec3& p) {
        auto ins = index.emplace(std::array<double,3>{p.x, p.y, p.z}, (int)mesh.verts.size());
        if (ins.second) mesh.verts.push_back(p);
        return ins.first->second;
    }
};

bool read_binary(std::istream& is, size_t file_size, Mesh& mesh, std::string& err) {
    char header[80];
    uint32_t count = 0;
    if (!is.read(header, 80) || !is.read(reinterpret_cast<char*>(&count), 4)) { err = "truncated binary STL header"; return false; }
    if (file_size < 84 + (size_t)count * 50) { err = "truncated binary STL: header announces " + std::to_string(count) + " triangles"; return false; }
    Welder w(mesh);
    mesh.faces.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        char rec[50];
        if (!is.read(rec, 50)) { err = "truncated binary STL at triangle " + std::to_string(i); return false; }
        float f[12];
        std::memcpy(f, rec, sizeof(f)); // normal (ignored) + 3 corners
        Vec3 p[3];
        for (int k = 0; k < 3; ++k) {
            p[k] = Vec3{f[3+3*k], f[4+3*k], f[5+3*k]};
            if (!finite_point(p[k])) { err = "non-finite vertex at triangle " + std::to_string(i); return false; }
        }
        int idx[3];
        for (int k = 0; k < 3; ++k) idx[k] = w.add(p[k]);
        mesh.faces.push_back({idx[0], idx[1], idx[2]});
    }
    return true;
}

bool read_ascii(std::istream& is, Mesh& mesh, std::string& err) {
    Welder w(mesh);
    std::string tok;
    int corner[3]; int nc = 0;
    bool in_facet = false, in_loop = false;
    const auto at = [&]() { return " at facet " + std::to_string(mesh.faces.size()); };
    while (is >> tok) {
        if (tok == "facet") {
            if (in_facet) { err = "unterminated facet" + at(); return false; }
            in_facet = true;
        } else if (tok == "loop") {
            in_loop = in_facet;
        } else if (tok == "endloop") {
            in_loop = false;
        } else if (tok == "vertex") {
            if (!in_loop) { err = "vertex outside outer loop" + at(); return false; }
            Vec3 p;
            if (!(is >> p.x >> p.y >> p.z)) { err = "bad vertex record" + at(); return false; }
            if (!finite_point(p)) { err = "non-finite vertex" + at(); return false; }
            if (nc == 3) { err = "facet with more than 3 vertices" + at(); return false; }
            corner[nc++] = w.add(p);
        } else if (tok == "endfacet") {
            if (nc != 3) { err = "facet with " + std::to_string(nc) + " vertices" + at(); return false; }
            mesh.faces.push_back({corner[0], corner[1], corner[2]});
            nc = 0;
            in_facet = in_loop = false;
        }
        // solid/normal/outer/endsolid carry nothing we keep.
    }
    if (in_facet || nc != 0) { err = "unterminated facet" + at(); return false; }
    return true;
}

void put_f32(std::ostream& os, double v) {
    float f = (float)v;
    os.write(reinterpret_cast<const char*>(&f), 4);
}

} // namespace

bool load_stl(const std::string& path, Mesh& mesh, std::string& err) {
    mesh.clear();
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) { err = "cannot open: " + path; return false; }
    size_t size = (size_t)ifs.tellg();
    ifs.seekg(0);

    // "solid" also starts many binary headers, so the size check wins.
    bool binary = true;
    if (size >= 84) {
        char head[84];
        ifs.read(head, 84);
        uint32_t count = 0;
        std::memcpy(&count, head + 80, 4);
        binary = size == 84 + (size_t)count * 50 || std::strncmp(head, "solid", 5) != 0;
    } else {
        char head[5] = {0,0,0,0,0};
        ifs.read(head, 5);
        binary = std::strncmp(head, "solid", 5) != 0;
    }
    ifs.clear();
    ifs.seekg(0);

    bool ok = binary ? read_binary(ifs, size, mesh, err) : read_ascii(ifs, mesh, err);
    if (!ok) { err = path + ": " + err; return false; }
    if (mesh.verts.empty() || mesh.faces.empty()) { err = "empty mesh from: " + path; return false; }
    return true;
}

bool save_stl(const std::string& path, const Mesh& mesh, bool ascii, std::string& err) {
    std::ofstream ofs(path, ascii ? std::ios::out : std::ios::out | std::ios::binary);
    if (!ofs) { err = "cannot write: " + path; return false; }

    auto facet_normal = [&](size_t fi) -> Vec3 {
        if (mesh.has_face_normals()) return mesh.face_normals[fi];
        const Tri& f = mesh.faces[fi];
        Vec3 n = cross(sub(mesh.verts[f.b], mesh.verts[f.a]), sub(mesh.verts[f.c], mesh.verts[f.a]));
        double L = len3(n);
        return L > 0.0 ? scale(n, 1.0 / L) : Vec3{};
    };

    if (ascii) {
        ofs << std::setprecision(9);
        ofs << "solid meshmirror\n";
        for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
            const Tri& f = mesh.faces[fi];
            Vec3 n = facet_normal(fi);
            ofs << "  facet normal " << n.x << ' ' << n.y << ' ' << n.z << "\n    outer loop\n";
            for (int c : {f.a, f.b, f.c}) {
                const Vec3& v = mesh.verts[c];
                ofs << "      vertex " << v.x << ' ' << v.y << ' ' << v.z << '\n';
            }
            ofs << "    endloop\n  endfacet\n";
        }
        ofs << "endsolid meshmirror\n";
    } else {
        std::string header = "meshmirror binary STL";
        header.resize(80, '\0');
        ofs.write(header.data(), 80);
        uint32_t count = (uint32_t)mesh.faces.size();
        ofs.write(reinterpret_cast<const char*>(&count), 4);
        for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
            const Tri& f = mesh.faces[fi];
            Vec3 n = facet_normal(fi);
            put_f32(ofs, n.x); put_f32(ofs, n.y); put_f32(ofs, n.z);
            for (int c : {f.a, f.b, f.c}) {
                const Vec3& v = mesh.verts[c];
                put_f32(ofs, v.x); put_f32(ofs, v.y); put_f32(ofs, v.z);
            }
            uint16_t attr = 0;
            ofs.write(reinterpret_cast<const char*>(&attr), 2);
        }
    }
    if (!ofs) { err = "write failed: " + path; return false; }
    return true;
}
