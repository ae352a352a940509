// errors.hpp - Fatal error record shared by the meshmirror pipeline stages.
//
// Stages return bool and fill a MirrorError on failure, the same way the I/O
// layer returns bool and fills a message string. Non-fatal conditions
// (degenerate faces, consistency warnings) never go through here; they are
// accumulated in MirrorReport instead.
//
#pragma once
#include <string>

enum class MirrorErrorKind {
    None,
    InvalidTransform,   // singular / non-finite / malformed reflection
    InvalidMesh,        // face index outside [0, num_verts)
};

struct MirrorError {
    MirrorErrorKind kind = MirrorErrorKind::None;
    int face = -1;      // offending face index (InvalidMesh)
    int corner = -1;    // 0,1,2 for a,b,c (InvalidMesh)
    long long value = 0; // offending index value (InvalidMesh)
    std::string message; // human-readable, includes the context above

    explicit operator bool() const { return kind != MirrorErrorKind::None; }
    void clear(){ kind = MirrorErrorKind::None; face = -1; corner = -1; value = 0; message.clear(); }
};

const char* error_kind_name(MirrorErrorKind kind);
