#pragma once

#include "core/SceneError.h"

#include <juce_core/juce_core.h>

#include <string>

namespace parley {

/// Reads mono source audio for file segments. Implementations must allow
/// concurrent calls from render worker threads.
class ClipReader {
public:
    virtual ~ClipReader() = default;

    /// Fill dest[0, numSamples) from the clip at `path`, starting at
    /// `startSample`. Fails with insufficientSourceMaterial when the clip is
    /// too short and io for anything else (missing, unreadable, wrong rate).
    virtual bool read(const std::string& path, juce::int64 startSample, int numSamples,
                      double sampleRate, float* dest, SceneError& error) = 0;
};

} // namespace parley
