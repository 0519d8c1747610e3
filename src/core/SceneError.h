#pragma once

#include <string>

namespace parley {

// Values are part of the C ABI (returned as status codes).
enum class ErrorKind : int {
    none = 0,
    structureFormat = 1,
    durationConflict = 2,
    insufficientSourceMaterial = 3,
    renderTarget = 4,
    io = 5
};

const char* errorKindName(ErrorKind kind);

struct SceneError {
    ErrorKind kind = ErrorKind::none;
    std::string message;
    std::string nodePath;   // e.g. "root.elements[1]"; empty when not tied to a node
    int segmentIndex = -1;  // index into the segment list; -1 when not tied to a segment

    bool ok() const { return kind == ErrorKind::none; }

    /// One line: "<kind> at <path|segment N>: <message>"
    std::string describe() const;

    void clear();
    void set(ErrorKind k, const std::string& msg,
             const std::string& path = "", int segment = -1);
};

} // namespace parley
