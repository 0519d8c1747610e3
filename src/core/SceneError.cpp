#include "core/SceneError.h"

namespace parley {

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::none:                       return "none";
        case ErrorKind::structureFormat:            return "StructureFormatError";
        case ErrorKind::durationConflict:           return "DurationConflictError";
        case ErrorKind::insufficientSourceMaterial: return "InsufficientSourceMaterialError";
        case ErrorKind::renderTarget:               return "RenderTargetError";
        case ErrorKind::io:                         return "IOError";
    }
    return "???";
}

std::string SceneError::describe() const
{
    if (ok())
        return "ok";

    std::string text = errorKindName(kind);
    if (!nodePath.empty())
        text += " at " + nodePath;
    else if (segmentIndex >= 0)
        text += " at segment " + std::to_string(segmentIndex);
    text += ": " + message;
    return text;
}

void SceneError::clear()
{
    kind = ErrorKind::none;
    message.clear();
    nodePath.clear();
    segmentIndex = -1;
}

void SceneError::set(ErrorKind k, const std::string& msg,
                     const std::string& path, int segment)
{
    kind = k;
    message = msg;
    nodePath = path;
    segmentIndex = segment;
}

} // namespace parley
