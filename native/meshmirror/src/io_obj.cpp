// io_obj.cpp - Tiny triangle-only OBJ reader/writer. Kept dependency-free and
// strict: a malformed face record is an error rather than silently skipped,
// since a dropped face would show up later as a bogus boundary edge.

#include "io_obj.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

// Trim trailing whitespace (incl. CR/LF). OBJ is line-oriented so this is sufficient
// to normalize lines before tokenizing with stringstreams.
static inline void trim(std::string& s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
}

// Accept tokens like "12", "12/34", "12//56", "-1" and only use the first field.
// Returns the 0-based index, or false when the token is not a usable index.
static bool parse_idx(const std::string& s, size_t nverts, int& out) {
    size_t p = s.find('/');
    std::string a = (p==std::string::npos) ? s : s.substr(0,p);
    long idx = 0; size_t used = 0;
    try { idx = std::stol(a, &used); }
    catch (const std::invalid_argument&) { return false; }
    catch (const std::out_of_range&) { return false; }
    if (used != a.size() || idx == 0) return false;
    // Negative indices are relative to the vertices read so far.
    long zero_based = idx > 0 ? idx - 1 : (long)nverts + idx;
    if (zero_based < 0 || zero_based > std::numeric_limits<int>::max()) return false;
    out = (int)zero_based;
    return true;
}

bool load_obj_tri(const std::string& path, Mesh& mesh, std::string& err) {
    mesh.clear(); // ensure target is empty before filling
    std::ifstream ifs(path);
    if (!ifs) { err = "cannot open: " + path; return false; }
    std::string line;
    size_t lineno = 0;
    while (std::getline(ifs, line)) {
        ++lineno;
        trim(line);
        if (line.empty() || line[0]=='#') continue; // ignore comments/blank lines
        std::istringstream iss(line);
        std::string tok; iss >> tok; // first token is the record type
        if (tok == "v") {
            Vec3 v;
            if (!(iss >> v.x >> v.y >> v.z)) { err = path + ":" + std::to_string(lineno) + ": bad vertex record"; return false; }
            mesh.verts.push_back(v);
        } else if (tok == "f") {
            std::string s1,s2,s3,extra; iss >> s1 >> s2 >> s3;
            if (iss >> extra) { err = path + ":" + std::to_string(lineno) + ": only triangle faces are supported"; return false; }
            int i=0, j=0, k=0;
            if (!parse_idx(s1, mesh.verts.size(), i) || !parse_idx(s2, mesh.verts.size(), j) || !parse_idx(s3, mesh.verts.size(), k)) {
                err = path + ":" + std::to_string(lineno) + ": bad face record";
                return false;
            }
            // Range checks against the final vertex count happen in the pipeline.
            mesh.faces.push_back({i, j, k});
        }
        // Other directives (vt, vn, usemtl, mtllib, o, g, s, etc.) are ignored.
    }
    if (mesh.verts.empty() || mesh.faces.empty()) { err = "empty mesh from: " + path; return false; }
    return true;
}

bool save_obj_tri(const std::string& path, const Mesh& mesh, std::string& err) {
    std::ofstream ofs(path);
    if (!ofs) { err = "cannot write: " + path; return false; }
    ofs << std::setprecision(17);
    ofs << "# meshmirror output\n";
    for (auto& v : mesh.verts) {
        ofs << "v " << v.x << ' ' << v.y << ' ' << v.z << '\n';
    }
    const bool with_vn = mesh.has_vertex_normals();
    if (with_vn) {
        for (auto& n : mesh.vertex_normals) ofs << "vn " << n.x << ' ' << n.y << ' ' << n.z << '\n';
    }
    // OBJ is 1-based, so we add 1 to each index.
    for (auto& f : mesh.faces) {
        if (with_vn) ofs << "f " << (f.a+1) << "//" << (f.a+1) << ' ' << (f.b+1) << "//" << (f.b+1) << ' ' << (f.c+1) << "//" << (f.c+1) << '\n';
        else ofs << "f " << (f.a+1) << ' ' << (f.b+1) << ' ' << (f.c+1) << '\n';
    }
    if (!ofs) { err = "write failed: " + path; return false; }
    return true;
}
