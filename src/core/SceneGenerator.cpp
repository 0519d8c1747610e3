#include "core/SceneGenerator.h"
#include "core/Logger.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace parley {

static std::string childPath(const std::string& path, size_t index)
{
    return path + ".elements[" + std::to_string(index) + "]";
}

SceneGenerator::SceneGenerator(const GeneratorSettings& settings, ClipSource& clips,
                               TurnPolicy& policy)
    : settings_(settings)
    , clips_(clips)
    , policy_(policy)
{
}

ChannelId SceneGenerator::channelFor(SpeakerId speaker) const
{
    auto it = settings_.speakerChannels.find(speaker);
    if (it != settings_.speakerChannels.end())
        return it->second;
    return speaker;
}

bool SceneGenerator::generate(const StructureNode& root, juce::Random& rng,
                              std::vector<SceneSegment>& out, SceneError& error)
{
    out.clear();
    PL_INFO("SceneGenerator::generate: %d nodes, declared duration %.3fs",
            countNodes(root), declaredDuration(root));

    std::vector<SceneSegment> segments;
    TimelineContext end;
    clips_.checkpoint();
    if (!walk(root, "root", TimelineContext{}, rng, segments, end, error))
    {
        clips_.rollback();
        return false;
    }

    std::stable_sort(segments.begin(), segments.end(),
                     [](const SceneSegment& a, const SceneSegment& b) {
                         if (a.start != b.start)
                             return a.start < b.start;
                         return a.channel < b.channel;
                     });

    PL_INFO("SceneGenerator::generate: %d segments, scene ends at %.3fs",
            static_cast<int>(segments.size()), end.cursor);
    out = std::move(segments);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Structure walk
// ═══════════════════════════════════════════════════════════════════

bool SceneGenerator::walk(const StructureNode& node, const std::string& path,
                          const TimelineContext& in, juce::Random& rng,
                          std::vector<SceneSegment>& out, TimelineContext& next,
                          SceneError& error)
{
    PL_DEBUG("SceneGenerator: %s %s at %.3fs", nodeTypeName(node), path.c_str(), in.cursor);

    return std::visit(Overloaded{
        [&](const SequenceNode& n) {
            return walkSequence(n, path, in, rng, out, next, error);
        },
        [&](const SplitterNode& n) {
            return walkSplitter(n, path, in, rng, out, next, error);
        },
        [&](const ConversationNode& n) {
            return walkConversation(n, path, in, rng, out, next, error);
        },
        [&](const NoiseNode& n) {
            return walkNoise(n, path, in, rng, out, next, error);
        },
        [&](const PauseNode& n) {
            next = advanced(in, n.duration);
            return true;
        },
    }, node.value);
}

bool SceneGenerator::walkSequence(const SequenceNode& node, const std::string& path,
                                  const TimelineContext& in, juce::Random& rng,
                                  std::vector<SceneSegment>& out, TimelineContext& next,
                                  SceneError& error)
{
    TimelineContext ctx;
    if (!restrictScope(in, node.speakers, path, ctx, error))
        return false;

    for (size_t i = 0; i < node.elements.size(); ++i)
    {
        TimelineContext after;
        if (!walk(node.elements[i], childPath(path, i), ctx, rng, out, after, error))
            return false;
        ctx = std::move(after);
    }

    ctx.scope = in.scope;
    next = std::move(ctx);
    return true;
}

bool SceneGenerator::walkSplitter(const SplitterNode& node, const std::string& path,
                                  const TimelineContext& in, juce::Random& rng,
                                  std::vector<SceneSegment>& out, TimelineContext& next,
                                  SceneError& error)
{
    TimelineContext entry;
    if (!restrictScope(in, node.speakers, path, entry, error))
        return false;

    std::vector<TimelineContext> branches;
    branches.reserve(node.elements.size());
    for (size_t i = 0; i < node.elements.size(); ++i)
    {
        juce::Random branchRng(rng.nextInt64());
        TimelineContext after;
        if (!walk(node.elements[i], childPath(path, i), entry, branchRng, out, after, error))
            return false;
        branches.push_back(std::move(after));
    }

    next = mergeBranches(in, branches);
    PL_DEBUG("SceneGenerator: splitter %s [%.3f, %.3f)", path.c_str(), in.cursor, next.cursor);
    return true;
}

bool SceneGenerator::walkNoise(const NoiseNode& node, const std::string& path,
                               const TimelineContext& in, juce::Random& rng,
                               std::vector<SceneSegment>& out, TimelineContext& next,
                               SceneError& error)
{
    if (node.duration <= 0.0)
    {
        next = advanced(in, node.duration);
        return true;
    }

    GeneratorRef ref{node.params, rng.nextInt(std::numeric_limits<int>::max()), {}};
    if (node.params.kind == NoiseKind::babble
        && !chooseBabble(node, path, rng, ref.clips, error))
        return false;

    SceneSegment seg;
    seg.start = in.cursor;
    seg.end = in.cursor + node.duration;
    seg.channel = node.channel >= 0 ? node.channel : settings_.noiseChannel;
    seg.payload = std::move(ref);
    out.push_back(std::move(seg));
    next = advanced(in, node.duration);
    return true;
}

// Each talker is an unbroken chain of clips from randomly chosen source
// speakers, entering part way through its first clip
bool SceneGenerator::chooseBabble(const NoiseNode& node, const std::string& path,
                                  juce::Random& rng, std::vector<BabbleClip>& out,
                                  SceneError& error)
{
    if (node.sources.empty() || node.params.talkers < 1)
    {
        error.set(ErrorKind::structureFormat, "babble needs source speakers and talkers", path);
        PL_WARN("SceneGenerator: %s", error.describe().c_str());
        return false;
    }

    for (int talker = 0; talker < node.params.talkers; ++talker)
    {
        double at = 0.0;
        bool first = true;
        while (at < node.duration)
        {
            const auto speaker = node.sources[static_cast<size_t>(
                rng.nextInt(static_cast<int>(node.sources.size())))];
            ClipChoice clip;
            std::string message;
            if (!clips_.nextClip(speaker, 0.0, rng, clip, message))
            {
                error.set(ErrorKind::insufficientSourceMaterial, message, path);
                PL_WARN("SceneGenerator: %s", error.describe().c_str());
                return false;
            }

            const double offset = first ? clip.duration * rng.nextDouble() : 0.0;
            first = false;
            const double length = std::min(clip.duration - offset, node.duration - at);
            if (length <= 0.0)
                continue;

            out.push_back({clip.path, offset, at, length});
            at = length < node.duration - at ? at + length : node.duration;
        }
    }

    PL_DEBUG("SceneGenerator: babble %s, %d talkers from %d clips", path.c_str(),
             node.params.talkers, static_cast<int>(out.size()));
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Conversations
// ═══════════════════════════════════════════════════════════════════

std::vector<SceneGenerator::Turn> SceneGenerator::scheduleTurns(const ConversationNode& node,
                                                                const TimelineContext& in,
                                                                juce::Random& rng)
{
    const double convStart = in.cursor;
    const double convEnd = in.cursor + node.duration;
    const double minTurn = policy_.minimumTurnLength();

    std::vector<Turn> turns;
    std::map<SpeakerId, double> lastEnd = in.lastTurnEnd;
    SpeakerId previous = in.lastSpeaker;
    double nextStart = convStart;

    for (;;)
    {
        const SpeakerId speaker = policy_.nextSpeaker(node.speakers, previous, rng);
        auto it = lastEnd.find(speaker);
        const double ownEnd = it == lastEnd.end() ? 0.0 : it->second;
        const double start = std::max({nextStart, ownEnd, convStart});

        // Too little time left for another turn: the previous one runs to the end
        if (convEnd - start < minTurn)
        {
            if (turns.empty())
                turns.push_back({speaker, convStart, convEnd});
            else
                turns.back().end = convEnd;
            break;
        }

        double end = start + policy_.turnLength(speaker, rng);
        if (convEnd - end < minTurn)
            end = convEnd;

        turns.push_back({speaker, start, end});
        lastEnd[speaker] = end;
        previous = speaker;
        if (end >= convEnd)
            break;

        nextStart = std::max(convStart, end + policy_.gapAfter(speaker, rng));
    }

    return turns;
}

bool SceneGenerator::walkConversation(const ConversationNode& node, const std::string& path,
                                      const TimelineContext& in, juce::Random& rng,
                                      std::vector<SceneSegment>& out, TimelineContext& next,
                                      SceneError& error)
{
    TimelineContext scoped;
    if (!restrictScope(in, node.speakers, path, scoped, error))
        return false;

    const double minTurn = policy_.minimumTurnLength();
    const double required = static_cast<double>(node.speakers.size()) * minTurn;
    if (node.duration < required)
    {
        error.set(ErrorKind::durationConflict,
                  "duration " + juce::String(node.duration, 3).toStdString() + "s cannot seat "
                  + std::to_string(node.speakers.size()) + " speakers at a minimum turn of "
                  + juce::String(minTurn, 3).toStdString() + "s",
                  path);
        PL_WARN("SceneGenerator: %s", error.describe().c_str());
        return false;
    }

    auto turns = scheduleTurns(node, in, rng);

    // Clips are resolved only once the whole schedule stands, so a missing
    // clip leaves nothing behind
    std::vector<SceneSegment> segments;
    segments.reserve(turns.size());
    for (const auto& turn : turns)
    {
        ClipChoice clip;
        std::string message;
        if (!clips_.nextClip(turn.speaker, turn.end - turn.start, rng, clip, message))
        {
            error.set(ErrorKind::insufficientSourceMaterial, message, path);
            PL_WARN("SceneGenerator: %s", error.describe().c_str());
            return false;
        }

        SceneSegment seg;
        seg.start = turn.start;
        seg.end = turn.end;
        seg.channel = channelFor(turn.speaker);
        seg.speaker = turn.speaker;
        seg.payload = FileRef{clip.path, clip.offset};
        segments.push_back(std::move(seg));
    }

    next = advanced(in, node.duration);
    for (const auto& turn : turns)
    {
        auto& end = next.lastTurnEnd[turn.speaker];
        end = std::max(end, turn.end);
    }
    next.lastSpeaker = turns.back().speaker;

    PL_DEBUG("SceneGenerator: conversation %s [%.3f, %.3f) %d turns",
             path.c_str(), in.cursor, next.cursor, static_cast<int>(turns.size()));
    for (auto& seg : segments)
        out.push_back(std::move(seg));
    return true;
}

} // namespace parley
