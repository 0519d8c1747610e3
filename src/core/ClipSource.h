#pragma once

#include "core/Types.h"

#include <juce_core/juce_core.h>

#include <string>

namespace parley {

struct ClipChoice {
    std::string path;       // relative to the audio root
    double offset = 0.0;    // seconds into the clip where reading starts
    double duration = 0.0;  // full clip length in seconds
};

/// Supplies source clips to the scene generator. The generator only asks
/// for the next available clip of a speaker with at least a given length;
/// which clip that is belongs to the implementation.
class ClipSource {
public:
    virtual ~ClipSource() = default;

    /// Returns false (with `error` set) when no adequate clip is available.
    virtual bool nextClip(SpeakerId speaker, double minLength, juce::Random& rng,
                          ClipChoice& out, std::string& error) = 0;

    /// Remember the selection state; rollback() returns to it. The
    /// generator brackets each generate() call with these so a failed run
    /// consumes no clips. Stateless sources need neither.
    virtual void checkpoint() {}
    virtual void rollback() {}
};

} // namespace parley
