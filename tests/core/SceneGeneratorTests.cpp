#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/ClipPool.h"
#include "core/SceneFile.h"
#include "core/SceneGenerator.h"
#include "core/StructureBuilder.h"

#include <algorithm>
#include <map>

using namespace parley;
using Catch::Matchers::WithinAbs;

// --- Helpers ---

// Every request succeeds with a clip exactly as long as asked
class EndlessClipSource : public ClipSource {
public:
    bool nextClip(SpeakerId speaker, double minLength, juce::Random&,
                  ClipChoice& out, std::string&) override
    {
        out.path = "spk" + std::to_string(speaker) + ".wav";
        out.offset = 0.0;
        out.duration = minLength;
        return true;
    }
};

static void fillPool(ClipPool& pool, const std::vector<SpeakerId>& speakers)
{
    std::string error;
    for (auto s : speakers)
    {
        for (int i = 0; i < 4; ++i)
        {
            ClipInfo clip{s, "spk" + std::to_string(s) + "/utt" + std::to_string(i) + ".wav", 60.0};
            REQUIRE(pool.addClip(clip, error));
        }
    }
}

static bool runGenerate(const StructureNode& root, juce::int64 seed,
                        std::vector<SceneSegment>& out, SceneError& error,
                        const TurnSettings& turns = {}, const GeneratorSettings& settings = {},
                        const std::vector<SpeakerId>& poolSpeakers = {1, 2, 3, 4, 5, 6})
{
    ClipPool pool;
    fillPool(pool, poolSpeakers);
    auto policy = makeTurnPolicy(turns);
    SceneGenerator generator(settings, pool, *policy);
    juce::Random rng(seed);
    return generator.generate(root, rng, out, error);
}

static double earliestStart(const std::vector<SceneSegment>& segments)
{
    double t = 1e30;
    for (const auto& s : segments)
        t = std::min(t, s.start);
    return t;
}

static double latestEnd(const std::vector<SceneSegment>& segments)
{
    double t = 0.0;
    for (const auto& s : segments)
        t = std::max(t, s.end);
    return t;
}

static std::vector<SceneSegment> forSpeakers(const std::vector<SceneSegment>& segments,
                                             const std::vector<SpeakerId>& speakers)
{
    std::vector<SceneSegment> result;
    for (const auto& s : segments)
    {
        if (std::find(speakers.begin(), speakers.end(), s.speaker) != speakers.end())
            result.push_back(s);
    }
    return result;
}

static void checkNoChannelOverlap(const std::vector<SceneSegment>& segments)
{
    std::map<ChannelId, std::vector<SceneSegment>> byChannel;
    for (const auto& s : segments)
        byChannel[s.channel].push_back(s);

    for (auto& [channel, list] : byChannel)
    {
        std::sort(list.begin(), list.end(),
                  [](const SceneSegment& a, const SceneSegment& b) { return a.start < b.start; });
        for (size_t i = 1; i < list.size(); ++i)
            REQUIRE(list[i - 1].end <= list[i].start);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Timing
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("A conversation after a pause spans exactly its own interval")
{
    auto root = StructureNode::sequence({
        StructureNode::pause(20.0),
        StructureNode::conversation({1, 2, 3}, 120.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 1, segments, error));
    REQUIRE(!segments.empty());

    CHECK(earliestStart(segments) == 20.0);
    CHECK(latestEnd(segments) == 140.0);
    for (const auto& s : segments)
    {
        REQUIRE(s.isFile());
        REQUIRE(s.speaker >= 1);
        REQUIRE(s.speaker <= 3);
        REQUIRE(s.channel == s.speaker);
        REQUIRE(s.end > s.start);
    }
}

TEST_CASE("A splitter lasts as long as its longest branch")
{
    auto root = StructureNode::sequence({
        StructureNode::splitter({
            StructureNode::conversation({1, 2}, 120.0),
            StructureNode::conversation({3, 4}, 90.0),
        }),
        StructureNode::noise(10.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 2, segments, error));

    auto longBranch = forSpeakers(segments, {1, 2});
    auto shortBranch = forSpeakers(segments, {3, 4});
    CHECK(earliestStart(longBranch) == 0.0);
    CHECK(latestEnd(longBranch) == 120.0);
    CHECK(earliestStart(shortBranch) == 0.0);
    CHECK(latestEnd(shortBranch) == 90.0);
    for (const auto& s : shortBranch)
        REQUIRE(s.start < 90.0);

    // The noise after the splitter waits for the longer branch
    auto noise = std::find_if(segments.begin(), segments.end(),
                              [](const SceneSegment& s) { return !s.isFile(); });
    REQUIRE(noise != segments.end());
    CHECK(noise->start == 120.0);
    CHECK(noise->end == 130.0);
}

TEST_CASE("Sequence children follow each other")
{
    auto root = StructureNode::sequence({
        StructureNode::conversation({1, 2}, 30.0),
        StructureNode::pause(10.0),
        StructureNode::conversation({2, 3}, 40.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 3, segments, error));

    std::vector<SceneSegment> first, second;
    for (const auto& s : segments)
        (s.start < 30.0 ? first : second).push_back(s);

    CHECK(earliestStart(first) == 0.0);
    CHECK(latestEnd(first) == 30.0);
    CHECK(earliestStart(second) == 40.0);
    CHECK(latestEnd(second) == 80.0);
}

TEST_CASE("Back-to-back round robin turns tile the conversation")
{
    TurnSettings turns;
    turns.order = TurnOrder::roundRobin;
    turns.gapStdDev = 0.0;
    turns.minTurn = 2.0;
    turns.maxTurn = 5.0;

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(StructureNode::conversation({1, 2, 3}, 60.0), 4, segments, error, turns));
    REQUIRE(segments.size() >= 3);

    CHECK(segments.front().start == 0.0);
    CHECK(segments.back().end == 60.0);
    for (size_t i = 1; i < segments.size(); ++i)
    {
        REQUIRE(segments[i].start == segments[i - 1].end);
        REQUIRE(segments[i].speaker == segments[i - 1].speaker % 3 + 1);
    }
    for (const auto& s : segments)
        REQUIRE(s.duration() >= 2.0);
}

TEST_CASE("Turn overlap never exceeds the configured maximum")
{
    TurnSettings turns;
    turns.gapStdDev = 2.0;
    turns.maxOverlap = 0.75;
    turns.maxGap = 1.0;

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(StructureNode::conversation({1, 2, 3, 4}, 300.0), 5, segments, error, turns));

    bool sawOverlap = false;
    for (size_t i = 1; i < segments.size(); ++i)
    {
        REQUIRE(segments[i].start >= segments[i - 1].end - 0.75 - 1e-9);
        REQUIRE(segments[i].speaker != segments[i - 1].speaker);
        sawOverlap = sawOverlap || segments[i].start < segments[i - 1].end;
    }
    CHECK(sawOverlap);
    checkNoChannelOverlap(segments);
}

TEST_CASE("Segments on one channel never overlap")
{
    auto root = StructureNode::sequence({
        StructureNode::noise(5.0),
        StructureNode::splitter({
            StructureNode::sequence({
                StructureNode::conversation({1, 2}, 50.0),
                StructureNode::conversation({1, 2, 3}, 70.0),
            }),
            StructureNode::conversation({4, 5, 6}, 100.0),
        }),
        StructureNode::conversation({1, 2, 3, 4, 5, 6}, 60.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 6, segments, error));
    checkNoChannelOverlap(segments);
    CHECK(latestEnd(segments) == 5.0 + 120.0 + 60.0);
}

TEST_CASE("Generated segments are ordered by start then channel")
{
    auto root = StructureNode::splitter({
        StructureNode::conversation({3, 4}, 20.0),
        StructureNode::conversation({1, 2}, 20.0),
        StructureNode::noise(20.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 7, segments, error));

    for (size_t i = 1; i < segments.size(); ++i)
    {
        const auto& a = segments[i - 1];
        const auto& b = segments[i];
        REQUIRE((a.start < b.start || (a.start == b.start && a.channel <= b.channel)));
    }
    CHECK(segments[0].channel == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Determinism
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Equal seeds give identical scenes")
{
    auto root = StructureNode::sequence({
        StructureNode::splitter({
            StructureNode::conversation({1, 2, 3}, 90.0),
            StructureNode::conversation({4, 5}, 60.0),
        }),
        StructureNode::noise(3.0, NoiseParams{NoiseKind::pink, 0.2f}),
    });

    std::vector<SceneSegment> a, b, c;
    SceneError error;
    REQUIRE(runGenerate(root, 1234, a, error));
    REQUIRE(runGenerate(root, 1234, b, error));
    REQUIRE(runGenerate(root, 4321, c, error));

    CHECK(sceneToJson(a) == sceneToJson(b));
    CHECK(sceneToJson(a) != sceneToJson(c));
}

// ═══════════════════════════════════════════════════════════════════
// Noise and channels
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Noise goes to its own channel or the configured noise channel")
{
    GeneratorSettings settings;
    settings.noiseChannel = 9;

    auto root = StructureNode::sequence({
        StructureNode::noise(2.0),
        StructureNode::noise(3.0, NoiseParams{NoiseKind::white, 0.3f}, 4),
        StructureNode::noise(0.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 8, segments, error, {}, settings));
    REQUIRE(segments.size() == 2);

    CHECK(segments[0].channel == 9);
    CHECK(segments[0].speaker == 0);
    CHECK(segments[0].start == 0.0);
    CHECK(segments[0].end == 2.0);

    CHECK(segments[1].channel == 4);
    CHECK(segments[1].start == 2.0);
    CHECK(segments[1].end == 5.0);
    const auto& gen = std::get<GeneratorRef>(segments[1].payload);
    CHECK(gen.params.level == 0.3f);
    CHECK(gen.seed >= 0);
}

TEST_CASE("Speaker channels follow the configured map")
{
    GeneratorSettings settings;
    settings.speakerChannels[1] = 5;
    settings.speakerChannels[2] = 6;

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(StructureNode::conversation({1, 2, 3}, 30.0), 9, segments, error,
                        {}, settings));

    for (const auto& s : segments)
    {
        if (s.speaker == 1) REQUIRE(s.channel == 5);
        if (s.speaker == 2) REQUIRE(s.channel == 6);
        if (s.speaker == 3) REQUIRE(s.channel == 3);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("A zero-length conversation is a duration conflict")
{
    auto root = StructureNode::sequence({
        StructureNode::pause(1.0),
        StructureNode::conversation({1, 2}, 0.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(runGenerate(root, 1, segments, error));
    CHECK(error.kind == ErrorKind::durationConflict);
    CHECK(error.nodePath == "root.elements[1]");
    CHECK(segments.empty());
}

TEST_CASE("A conversation too short to seat every speaker is a duration conflict")
{
    TurnSettings turns;
    turns.minTurn = 2.0;

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(runGenerate(StructureNode::conversation({1, 2, 3}, 5.0), 1, segments, error, turns));
    CHECK(error.kind == ErrorKind::durationConflict);

    REQUIRE(runGenerate(StructureNode::conversation({1, 2, 3}, 6.0), 1, segments, error, turns));
}

TEST_CASE("A speaker outside the enclosing set is a format error")
{
    auto root = StructureNode::sequence({
        StructureNode::conversation({1, 3}, 30.0),
    }, {1, 2});

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(runGenerate(root, 1, segments, error));
    CHECK(error.kind == ErrorKind::structureFormat);
    CHECK(error.nodePath == "root.elements[0]");
}

TEST_CASE("Missing clips are insufficient source material and emit nothing")
{
    auto root = StructureNode::sequence({
        StructureNode::conversation({1, 2}, 30.0),
        StructureNode::conversation({1, 7}, 30.0),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(runGenerate(root, 1, segments, error, {}, {}, {1, 2}));
    CHECK(error.kind == ErrorKind::insufficientSourceMaterial);
    CHECK(error.nodePath == "root.elements[1]");
    CHECK(segments.empty());
}

TEST_CASE("Clips shorter than a turn are insufficient source material")
{
    ClipPool pool;
    std::string message;
    REQUIRE(pool.addClip({1, "a.wav", 1.0}, message));
    REQUIRE(pool.addClip({2, "b.wav", 1.0}, message));

    auto policy = makeTurnPolicy(TurnSettings{});
    SceneGenerator generator(GeneratorSettings{}, pool, *policy);
    juce::Random rng(1);
    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(generator.generate(StructureNode::conversation({1, 2}, 20.0), rng, segments, error));
    CHECK(error.kind == ErrorKind::insufficientSourceMaterial);
    CHECK(error.nodePath == "root");
}

// ═══════════════════════════════════════════════════════════════════
// Babble
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Babble chains clips for every talker across the whole noise span")
{
    auto root = StructureNode::sequence({
        StructureNode::pause(5.0),
        StructureNode::noise(150.0, NoiseParams{NoiseKind::babble, 0.2f, 3}, -1, {5, 6}),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE(runGenerate(root, 12, segments, error));
    REQUIRE(segments.size() == 1);
    CHECK(segments[0].start == 5.0);
    CHECK(segments[0].end == 155.0);
    CHECK(segments[0].channel == 0);

    const auto& gen = std::get<GeneratorRef>(segments[0].payload);
    int talkers = 0;
    double chainEnd = 0.0;
    for (const auto& clip : gen.clips)
    {
        if (clip.at == 0.0)
        {
            if (talkers > 0)
                CHECK_THAT(chainEnd, WithinAbs(150.0, 1e-9));
            ++talkers;
        }
        else
        {
            REQUIRE(clip.at == chainEnd);
        }
        REQUIRE(clip.length > 0.0);
        REQUIRE(clip.clipOffset + clip.length <= 60.0);
        REQUIRE((clip.path.rfind("spk5/", 0) == 0 || clip.path.rfind("spk6/", 0) == 0));
        chainEnd = clip.at + clip.length;
    }
    CHECK(talkers == 3);
    CHECK_THAT(chainEnd, WithinAbs(150.0, 1e-9));
}

TEST_CASE("Babble without clips for its sources is insufficient source material")
{
    auto root = StructureNode::sequence({
        StructureNode::conversation({1, 2}, 20.0),
        StructureNode::noise(10.0, NoiseParams{NoiseKind::babble, 0.2f, 2}, -1, {40}),
    });

    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(runGenerate(root, 1, segments, error));
    CHECK(error.kind == ErrorKind::insufficientSourceMaterial);
    CHECK(error.nodePath == "root.elements[1]");
    CHECK(segments.empty());
}

// ═══════════════════════════════════════════════════════════════════
// Built structures
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Built parallel-table structures always generate with default turn settings")
{
    TableLayout layout;
    layout.tableSizes = {4, 4, 4};
    layout.duration = 1800;
    layout.segment = true;

    EndlessClipSource clips;
    auto policy = makeTurnPolicy(TurnSettings{});
    SceneGenerator generator(GeneratorSettings{}, clips, *policy);

    for (int seed = 0; seed < 200; ++seed)
    {
        juce::Random buildRng(seed);
        auto root = makeParallelConversations(layout, buildRng);

        juce::Random rng(seed);
        std::vector<SceneSegment> segments;
        SceneError error;
        if (!generator.generate(root, rng, segments, error))
            FAIL("seed " << seed << ": " << error.describe());
        REQUIRE(latestEnd(segments) == 1800.0);
    }
}

TEST_CASE("A failed generate hands no clips out of the pool")
{
    ClipSettings clipSettings;
    clipSettings.allowReuse = false;
    ClipPool pool(clipSettings);
    fillPool(pool, {1, 2});

    auto root = StructureNode::sequence({
        StructureNode::conversation({1, 2}, 10.0),
        StructureNode::conversation({1, 9}, 10.0),
    });

    auto policy = makeTurnPolicy(TurnSettings{});
    SceneGenerator generator(GeneratorSettings{}, pool, *policy);
    juce::Random rng(3);
    std::vector<SceneSegment> segments;
    SceneError error;
    REQUIRE_FALSE(generator.generate(root, rng, segments, error));
    CHECK(error.nodePath == "root.elements[1]");

    ClipChoice choice;
    std::string message;
    REQUIRE(pool.nextClip(1, 1.0, rng, choice, message));
    CHECK(choice.path == "spk1/utt0.wav");
    REQUIRE(pool.nextClip(2, 1.0, rng, choice, message));
    CHECK(choice.path == "spk2/utt0.wav");
}
