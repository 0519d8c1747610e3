#pragma once

#include "core/ClipReader.h"
#include "core/SceneError.h"
#include "core/SceneSegment.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <vector>

namespace parley {

/// Materialises a segment list into a channels x samples buffer.
/// Segments overwrite their own [index(start), index(end)) range; nothing
/// is mixed across segments, so processing order never changes the result.
/// Babble is mixed from its clips inside its own range.
class SceneRenderer {
public:
    /// threads <= 1 renders inline; more renders one job per channel.
    explicit SceneRenderer(ClipReader& reader, int threads = 1);
    ~SceneRenderer() = default;

    SceneRenderer(const SceneRenderer&) = delete;
    SceneRenderer& operator=(const SceneRenderer&) = delete;

    /// On failure `out` is left with zero channels and samples and `error`
    /// carries the lowest failing segment index.
    bool render(const std::vector<SceneSegment>& segments, int channelCount,
                double sampleRate, juce::AudioBuffer<float>& out, SceneError& error);

    // --- Sample arithmetic ---

    /// floor(t * sampleRate + 0.5): round half up.
    static juce::int64 timeToSample(double seconds, double sampleRate);

    /// ceil(max end * sampleRate); 0 for an empty list.
    static juce::int64 totalSamples(const std::vector<SceneSegment>& segments, double sampleRate);

    int getThreads() const { return threads_; }

private:
    bool validate(const std::vector<SceneSegment>& segments, int channelCount,
                  double sampleRate, juce::int64 length, SceneError& error) const;
    bool renderSegment(const SceneSegment& seg, int index, double sampleRate,
                       float* channelData, SceneError& error);
    bool mixBabble(const GeneratorRef& gen, double sampleRate, float* dest, int numSamples,
                   SceneError& error);
    bool renderThreaded(const std::vector<SceneSegment>& segments, int channelCount,
                        double sampleRate, float* const* channels, SceneError& error);

    ClipReader& reader_;
    int threads_;
};

} // namespace parley
