#pragma once

#include "core/Types.h"

#include <variant>
#include <string>
#include <vector>

namespace parley {

/// Audio taken from a source clip, starting `clipOffset` seconds into it.
struct FileRef {
    std::string path;
    double clipOffset = 0.0;
};

/// One piece of a babble talker's stream: `length` seconds of the clip
/// from `clipOffset`, placed `at` seconds after the segment start.
struct BabbleClip {
    std::string path;
    double clipOffset = 0.0;
    double at = 0.0;
    double length = 0.0;
};

/// Synthesised audio; the seed makes the render reproducible.
/// Babble carries the clips it is mixed from.
struct GeneratorRef {
    NoiseParams params;
    int seed = 0;
    std::vector<BabbleClip> clips;
};

/// One timed audio event on one output channel, [start, end) in seconds.
struct SceneSegment {
    double start = 0.0;
    double end = 0.0;
    ChannelId channel = 0;
    SpeakerId speaker = 0;      // 0 for generator segments
    std::variant<FileRef, GeneratorRef> payload;

    double duration() const { return end - start; }
    bool isFile() const { return std::holds_alternative<FileRef>(payload); }
};

} // namespace parley
