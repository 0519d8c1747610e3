#pragma once

#include <string>

namespace parley {

inline const char* getVersion() { return "0.1.0"; }

using SpeakerId = int;
using ChannelId = int;

enum class NoiseKind { white, pink, babble };

struct NoiseParams {
    NoiseKind kind = NoiseKind::white;
    float level = 0.1f;     // peak amplitude, (0, 1]
    int talkers = 4;        // babble only: overlapping speech streams
};

inline const char* noiseKindName(NoiseKind kind)
{
    switch (kind)
    {
        case NoiseKind::white: return "white";
        case NoiseKind::pink:  return "pink";
        case NoiseKind::babble: return "babble";
    }
    return "???";
}

inline bool parseNoiseKind(const std::string& name, NoiseKind& kind)
{
    if (name == "white") { kind = NoiseKind::white; return true; }
    if (name == "pink")  { kind = NoiseKind::pink;  return true; }
    if (name == "babble") { kind = NoiseKind::babble; return true; }
    return false;
}

} // namespace parley
