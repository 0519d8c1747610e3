#include <catch2/catch_test_macros.hpp>

#include "core/ClipPool.h"
#include "core/NoiseGenerator.h"
#include "core/SceneGenerator.h"
#include "core/SceneRenderer.h"

#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <vector>

using namespace parley;

// --- Fake reader: every clip is a constant level ---

class ConstantClipReader : public ClipReader {
public:
    std::map<std::string, float> levels;
    std::set<std::string> failing;

    bool read(const std::string& path, juce::int64 startSample, int numSamples,
              double, float* dest, SceneError& error) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            starts_.push_back(startSample);
        }
        if (failing.count(path) > 0)
        {
            error.set(ErrorKind::io, "cannot open " + path);
            return false;
        }
        auto it = levels.find(path);
        const float level = it == levels.end() ? 1.0f : it->second;
        for (int i = 0; i < numSamples; ++i)
            dest[i] = level;
        return true;
    }

    std::vector<juce::int64> starts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<juce::int64> starts_;
};

// --- Fake reader: clips of known length that refuse to read past their end ---

class BoundedClipReader : public ClipReader {
public:
    std::map<std::string, juce::int64> lengths;

    bool read(const std::string& path, juce::int64 startSample, int numSamples,
              double, float* dest, SceneError& error) override
    {
        auto it = lengths.find(path);
        if (it == lengths.end() || startSample < 0 || startSample + numSamples > it->second)
        {
            error.set(ErrorKind::insufficientSourceMaterial, "read past the end of " + path);
            return false;
        }
        for (int i = 0; i < numSamples; ++i)
            dest[i] = 1.0f;
        return true;
    }
};

static SceneSegment fileSegment(double start, double end, ChannelId channel,
                                const std::string& path, double offset = 0.0)
{
    SceneSegment seg;
    seg.start = start;
    seg.end = end;
    seg.channel = channel;
    seg.speaker = channel;
    seg.payload = FileRef{path, offset};
    return seg;
}

static SceneSegment noiseSegment(double start, double end, ChannelId channel, int seed)
{
    SceneSegment seg;
    seg.start = start;
    seg.end = end;
    seg.channel = channel;
    seg.payload = GeneratorRef{NoiseParams{NoiseKind::pink, 0.2f}, seed};
    return seg;
}

static bool sameBuffers(const juce::AudioBuffer<float>& a, const juce::AudioBuffer<float>& b)
{
    if (a.getNumChannels() != b.getNumChannels() || a.getNumSamples() != b.getNumSamples())
        return false;
    for (int ch = 0; ch < a.getNumChannels(); ++ch)
        for (int i = 0; i < a.getNumSamples(); ++i)
            if (a.getSample(ch, i) != b.getSample(ch, i))
                return false;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Sample arithmetic
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("timeToSample rounds half up")
{
    CHECK(SceneRenderer::timeToSample(0.0, 10.0) == 0);
    CHECK(SceneRenderer::timeToSample(0.24, 10.0) == 2);
    CHECK(SceneRenderer::timeToSample(0.25, 10.0) == 3);
    CHECK(SceneRenderer::timeToSample(1.0, 16000.0) == 16000);
}

TEST_CASE("totalSamples is the ceiling of the latest end")
{
    std::vector<SceneSegment> segments{
        fileSegment(0.0, 1.01, 0, "a"),
        fileSegment(0.2, 0.5, 1, "b"),
    };
    CHECK(SceneRenderer::totalSamples(segments, 10.0) == 11);
    CHECK(SceneRenderer::totalSamples({}, 10.0) == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Rendering
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("An empty scene renders zero samples")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);
    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({}, 2, 16000.0, out, error));
    CHECK(out.getNumChannels() == 2);
    CHECK(out.getNumSamples() == 0);
}

TEST_CASE("Segments fill their own range and leave silence elsewhere")
{
    ConstantClipReader reader;
    reader.levels["a"] = 0.5f;
    SceneRenderer renderer(reader);

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({fileSegment(0.2, 1.01, 1, "a")}, 3, 10.0, out, error));
    REQUIRE(out.getNumChannels() == 3);
    REQUIRE(out.getNumSamples() == 11);

    // [round(2.0), round(10.1)) = [2, 10)
    for (int i = 0; i < 11; ++i)
    {
        CHECK(out.getSample(0, i) == 0.0f);
        CHECK(out.getSample(2, i) == 0.0f);
        CHECK(out.getSample(1, i) == ((i >= 2 && i < 10) ? 0.5f : 0.0f));
    }
}

TEST_CASE("Adjacent segments leave no gap")
{
    ConstantClipReader reader;
    reader.levels["a"] = 0.25f;
    reader.levels["b"] = 0.75f;
    SceneRenderer renderer(reader);

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({fileSegment(0.0, 0.5, 0, "a"), fileSegment(0.5, 1.0, 0, "b")},
                            1, 10.0, out, error));
    REQUIRE(out.getNumSamples() == 10);
    for (int i = 0; i < 5; ++i)
        CHECK(out.getSample(0, i) == 0.25f);
    for (int i = 5; i < 10; ++i)
        CHECK(out.getSample(0, i) == 0.75f);
}

TEST_CASE("Later segments overwrite earlier ones instead of mixing")
{
    ConstantClipReader reader;
    reader.levels["a"] = 0.25f;
    reader.levels["b"] = 0.5f;
    SceneRenderer renderer(reader);

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({fileSegment(0.0, 1.0, 0, "a"), fileSegment(0.5, 1.0, 0, "b")},
                            1, 10.0, out, error));
    CHECK(out.getSample(0, 4) == 0.25f);
    CHECK(out.getSample(0, 5) == 0.5f);
    CHECK(out.getSample(0, 9) == 0.5f);
}

TEST_CASE("Rendering the same scene twice gives the same buffer")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);
    std::vector<SceneSegment> segments{
        noiseSegment(0.0, 2.0, 0, 11),
        fileSegment(0.5, 1.5, 1, "a"),
    };

    juce::AudioBuffer<float> first, second;
    SceneError error;
    REQUIRE(renderer.render(segments, 2, 100.0, first, error));
    REQUIRE(renderer.render(segments, 2, 100.0, second, error));
    CHECK(sameBuffers(first, second));
}

TEST_CASE("Generator segments render the seeded noise")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({noiseSegment(1.0, 3.0, 0, 99)}, 1, 100.0, out, error));
    REQUIRE(out.getNumSamples() == 300);

    std::vector<float> expected(200);
    NoiseGenerator::fill(NoiseParams{NoiseKind::pink, 0.2f}, 99, expected.data(), 200);
    for (int i = 0; i < 100; ++i)
        REQUIRE(out.getSample(0, i) == 0.0f);
    for (int i = 0; i < 200; ++i)
        REQUIRE(out.getSample(0, 100 + i) == expected[static_cast<size_t>(i)]);
}

TEST_CASE("Clip offsets become the reader's start sample")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({fileSegment(0.0, 1.0, 0, "a", 0.25)}, 1, 10.0, out, error));
    REQUIRE(reader.starts().size() == 1);
    CHECK(reader.starts()[0] == 3);
}

TEST_CASE("Babble mixes its clips at equal loudness and peaks at its level")
{
    ConstantClipReader reader;
    reader.levels = {{"a", 0.5f}, {"b", 0.25f}};
    SceneRenderer renderer(reader);

    SceneSegment seg;
    seg.start = 0.0;
    seg.end = 2.0;
    GeneratorRef ref;
    ref.params = NoiseParams{NoiseKind::babble, 0.2f, 2};
    ref.clips = {{"a", 0.0, 0.0, 2.0}, {"b", 0.35, 1.0, 1.0}};
    seg.payload = ref;

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE(renderer.render({seg}, 1, 10.0, out, error));
    REQUIRE(out.getNumSamples() == 20);
    for (int i = 0; i < 10; ++i)
        REQUIRE(std::abs(out.getSample(0, i) - 0.1f) < 1e-6f);
    for (int i = 10; i < 20; ++i)
        REQUIRE(std::abs(out.getSample(0, i) - 0.2f) < 1e-6f);

    const auto starts = reader.starts();
    REQUIRE(starts.size() == 2);
    CHECK(starts[1] == 3);
}

TEST_CASE("A failing babble clip fails its segment")
{
    ConstantClipReader reader;
    reader.failing = {"gone"};
    SceneRenderer renderer(reader);

    SceneSegment seg;
    seg.end = 1.0;
    GeneratorRef ref;
    ref.params = NoiseParams{NoiseKind::babble, 0.2f, 1};
    ref.clips = {{"gone", 0.0, 0.0, 1.0}};
    seg.payload = ref;

    juce::AudioBuffer<float> out;
    SceneError error;
    REQUIRE_FALSE(renderer.render({fileSegment(0.0, 1.0, 1, "a"), seg}, 2, 10.0, out, error));
    CHECK(error.kind == ErrorKind::io);
    CHECK(error.segmentIndex == 1);
}

// ═══════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("An invalid render target is rejected")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);
    juce::AudioBuffer<float> out(2, 10);
    SceneError error;

    CHECK_FALSE(renderer.render({}, 0, 16000.0, out, error));
    CHECK(error.kind == ErrorKind::renderTarget);
    CHECK(out.getNumChannels() == 0);
    CHECK(out.getNumSamples() == 0);

    error.clear();
    CHECK_FALSE(renderer.render({}, 1, 0.0, out, error));
    CHECK(error.kind == ErrorKind::renderTarget);
}

TEST_CASE("A segment on a missing channel names its index")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);
    juce::AudioBuffer<float> out;
    SceneError error;

    CHECK_FALSE(renderer.render({fileSegment(0.0, 1.0, 0, "a"), fileSegment(0.0, 1.0, 2, "b")},
                                2, 10.0, out, error));
    CHECK(error.kind == ErrorKind::renderTarget);
    CHECK(error.segmentIndex == 1);
    CHECK(out.getNumSamples() == 0);
    CHECK(reader.starts().empty());
}

TEST_CASE("A segment that ends before it starts is a render target error")
{
    ConstantClipReader reader;
    SceneRenderer renderer(reader);
    juce::AudioBuffer<float> out;
    SceneError error;

    CHECK_FALSE(renderer.render({fileSegment(1.0, 1.0, 0, "a")}, 1, 10.0, out, error));
    CHECK(error.kind == ErrorKind::renderTarget);
    CHECK(error.segmentIndex == 0);

    error.clear();
    CHECK_FALSE(renderer.render({fileSegment(-1.0, 1.0, 0, "a")}, 1, 10.0, out, error));
    CHECK(error.kind == ErrorKind::renderTarget);
}

TEST_CASE("Reader failures carry the segment index")
{
    ConstantClipReader reader;
    reader.failing.insert("broken");
    SceneRenderer renderer(reader);
    juce::AudioBuffer<float> out;
    SceneError error;

    CHECK_FALSE(renderer.render({fileSegment(0.0, 1.0, 0, "a"), fileSegment(1.0, 2.0, 0, "broken")},
                                1, 10.0, out, error));
    CHECK(error.kind == ErrorKind::io);
    CHECK(error.segmentIndex == 1);
    CHECK(out.getNumChannels() == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Threaded rendering
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Threaded rendering matches inline rendering")
{
    ConstantClipReader reader;
    reader.levels["a"] = 0.1f;
    reader.levels["b"] = 0.2f;
    reader.levels["c"] = 0.3f;

    std::vector<SceneSegment> segments;
    for (int i = 0; i < 40; ++i)
    {
        const double start = 0.25 * i;
        const ChannelId ch = 1 + i % 3;
        segments.push_back(fileSegment(start, start + 0.7, ch, i % 2 == 0 ? "a" : (i % 3 == 0 ? "b" : "c")));
    }
    segments.push_back(noiseSegment(0.0, 10.0, 0, 5));

    SceneRenderer inlineRenderer(reader, 1);
    SceneRenderer threadedRenderer(reader, 4);
    CHECK(threadedRenderer.getThreads() == 4);

    juce::AudioBuffer<float> expected, actual;
    SceneError error;
    REQUIRE(inlineRenderer.render(segments, 4, 1000.0, expected, error));
    REQUIRE(threadedRenderer.render(segments, 4, 1000.0, actual, error));
    CHECK(sameBuffers(expected, actual));
}

TEST_CASE("Threaded rendering reports the lowest failing segment")
{
    ConstantClipReader reader;
    reader.failing.insert("broken");
    SceneRenderer renderer(reader, 3);

    std::vector<SceneSegment> segments{
        fileSegment(0.0, 1.0, 0, "a"),
        fileSegment(0.0, 1.0, 1, "a"),
        fileSegment(1.0, 2.0, 1, "broken"),
        fileSegment(1.0, 2.0, 2, "a"),
        fileSegment(2.0, 3.0, 2, "a"),
        fileSegment(2.0, 3.0, 0, "broken"),
    };

    juce::AudioBuffer<float> out;
    SceneError error;
    CHECK_FALSE(renderer.render(segments, 3, 10.0, out, error));
    CHECK(error.kind == ErrorKind::io);
    CHECK(error.segmentIndex == 2);
    CHECK(out.getNumSamples() == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Generated scenes
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Generated scenes with random clip offsets never read past a clip")
{
    const char* index =
        "speaker,file_name,length\n"
        "1,s1_a.wav,96007\n"
        "1,s1_b.wav,100003\n"
        "1,s1_c.wav,112345\n"
        "2,s2_a.wav,96001\n"
        "2,s2_b.wav,99999\n"
        "2,s2_c.wav,104729\n";

    BoundedClipReader reader;
    reader.lengths = {{"s1_a.wav", 96007}, {"s1_b.wav", 100003}, {"s1_c.wav", 112345},
                      {"s2_a.wav", 96001}, {"s2_b.wav", 99999}, {"s2_c.wav", 104729}};
    SceneRenderer renderer(reader);

    TurnSettings turns;
    turns.minTurn = 1.0;
    turns.maxTurn = 3.0;
    turns.gapStdDev = 0.3;

    for (int seed = 0; seed < 50; ++seed)
    {
        ClipSettings clipSettings;
        clipSettings.randomOffset = true;
        ClipPool pool(clipSettings);
        std::string message;
        REQUIRE(pool.loadIndex(index, 16000.0, {}, message));

        auto policy = makeTurnPolicy(turns);
        SceneGenerator generator(GeneratorSettings{}, pool, *policy);
        juce::Random rng(seed);
        std::vector<SceneSegment> segments;
        SceneError error;
        REQUIRE(generator.generate(StructureNode::conversation({1, 2}, 60.0), rng, segments, error));

        juce::AudioBuffer<float> out;
        if (!renderer.render(segments, 3, 16000.0, out, error))
            FAIL("seed " << seed << ": " << error.describe());
    }
}
