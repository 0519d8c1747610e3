#pragma once

#include "core/ClipSource.h"
#include "core/SceneError.h"
#include "core/SceneSegment.h"
#include "core/Structure.h"
#include "core/Timeline.h"
#include "core/TurnPolicy.h"

#include <juce_core/juce_core.h>

#include <map>
#include <string>
#include <vector>

namespace parley {

struct GeneratorSettings {
    ChannelId noiseChannel = 0;                     // noise nodes without their own channel
    std::map<SpeakerId, ChannelId> speakerChannels; // unmapped speakers use their id
};

/// Walks a structure tree and emits the time-stamped scene segments.
/// The walk is single threaded; every random draw comes from the generator
/// passed to generate(), each splitter branch from its own fork of it.
class SceneGenerator {
public:
    SceneGenerator(const GeneratorSettings& settings, ClipSource& clips, TurnPolicy& policy);
    ~SceneGenerator() = default;

    SceneGenerator(const SceneGenerator&) = delete;
    SceneGenerator& operator=(const SceneGenerator&) = delete;

    /// Segments sorted by (start, channel). On failure `out` is left empty
    /// and the clip source is rolled back to where it was before the call.
    bool generate(const StructureNode& root, juce::Random& rng,
                  std::vector<SceneSegment>& out, SceneError& error);

    ChannelId channelFor(SpeakerId speaker) const;

private:
    struct Turn {
        SpeakerId speaker;
        double start;
        double end;
    };

    bool walk(const StructureNode& node, const std::string& path, const TimelineContext& in,
              juce::Random& rng, std::vector<SceneSegment>& out,
              TimelineContext& next, SceneError& error);

    bool walkSequence(const SequenceNode& node, const std::string& path,
                      const TimelineContext& in, juce::Random& rng,
                      std::vector<SceneSegment>& out, TimelineContext& next, SceneError& error);
    bool walkSplitter(const SplitterNode& node, const std::string& path,
                      const TimelineContext& in, juce::Random& rng,
                      std::vector<SceneSegment>& out, TimelineContext& next, SceneError& error);
    bool walkConversation(const ConversationNode& node, const std::string& path,
                          const TimelineContext& in, juce::Random& rng,
                          std::vector<SceneSegment>& out, TimelineContext& next, SceneError& error);
    bool walkNoise(const NoiseNode& node, const std::string& path, const TimelineContext& in,
                   juce::Random& rng, std::vector<SceneSegment>& out, TimelineContext& next,
                   SceneError& error);
    bool chooseBabble(const NoiseNode& node, const std::string& path, juce::Random& rng,
                      std::vector<BabbleClip>& out, SceneError& error);

    std::vector<Turn> scheduleTurns(const ConversationNode& node, const TimelineContext& in,
                                    juce::Random& rng);

    GeneratorSettings settings_;
    ClipSource& clips_;
    TurnPolicy& policy_;
};

} // namespace parley
