#include "core/AudioFileClipReader.h"
#include "core/ClipPool.h"
#include "core/Logger.h"
#include "core/SceneConfig.h"
#include "core/SceneFile.h"
#include "core/SceneGenerator.h"
#include "core/SceneRenderer.h"
#include "core/SessionBuilder.h"
#include "core/StructureBuilder.h"
#include "core/StructureParser.h"

#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_core/juce_core.h>

#include <algorithm>
#include <iostream>
#include <memory>

using namespace parley;

// --- Argument helpers ---

static juce::String requiredOption(const juce::ArgumentList& args, const char* option)
{
    auto value = args.getValueForOption(option);
    if (value.isEmpty())
        juce::ConsoleApplication::fail(juce::String("Missing required option ") + option + "=...");
    return value;
}

static std::vector<int> parseIntList(const juce::String& text, const char* option)
{
    std::vector<int> values;
    for (auto& token : juce::StringArray::fromTokens(text, ",", ""))
    {
        auto trimmed = token.trim();
        if (trimmed.isEmpty() || !trimmed.containsOnly("0123456789"))
            juce::ConsoleApplication::fail(juce::String(option) + " expects a comma separated list of integers");
        values.push_back(trimmed.getIntValue());
    }
    return values;
}

static void failOn(const SceneError& error)
{
    juce::ConsoleApplication::fail(error.describe(), static_cast<int>(error.kind));
}

// Config file (if any) first, then command line overrides
static SceneConfig loadSettings(const juce::ArgumentList& args)
{
    SceneConfig config;
    SceneError error;
    auto path = args.getValueForOption("--config");
    if (path.isNotEmpty() && !loadConfigFile(path.toStdString(), config, error))
        failOn(error);

    auto seed = args.getValueForOption("--seed");
    if (seed.isNotEmpty())
        config.seed = seed.getLargeIntValue();

    auto level = args.getValueForOption("--log-level");
    if (level.isNotEmpty() && !Logger::parseLevel(level.toRawUTF8(), config.logLevel))
        juce::ConsoleApplication::fail("Unknown log level " + level);

    Logger::setLevel(config.logLevel);
    return config;
}

static TableLayout parseLayout(const juce::ArgumentList& args, const SceneConfig& config)
{
    TableLayout layout;
    layout.tableSizes = parseIntList(requiredOption(args, "--tables"), "--tables");
    layout.duration = requiredOption(args, "--duration").getIntValue();
    layout.segment = args.containsOption("--segment");
    layout.minTurn = config.turns.minTurn;
    auto halfLife = args.getValueForOption("--half-life");
    if (halfLife.isNotEmpty())
        layout.halfLife = halfLife.getDoubleValue();
    auto minDuration = args.getValueForOption("--min-duration");
    if (minDuration.isNotEmpty())
        layout.minDuration = minDuration.getIntValue();

    if (layout.duration <= 0 || layout.halfLife <= 0.0)
        juce::ConsoleApplication::fail("--duration and --half-life must be positive");
    return layout;
}

static void writeText(const juce::ArgumentList& args, const std::string& text)
{
    auto out = args.getValueForOption("--out");
    if (out.isEmpty())
    {
        std::cout << text << std::endl;
        return;
    }

    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(out);
    if (!file.replaceWithText(juce::String(text)))
        juce::ConsoleApplication::fail("Cannot write " + file.getFullPathName());
    PL_INFO("wrote %s", file.getFullPathName().toRawUTF8());
}

// ═══════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════

static void runStructure(const juce::ArgumentList& args)
{
    auto config = loadSettings(args);
    auto layout = parseLayout(args, config);

    juce::Random rng(config.seed);
    writeText(args, structureToJson(makeParallelConversations(layout, rng)));
}

static void runGenerate(const juce::ArgumentList& args)
{
    auto config = loadSettings(args);
    auto speakers = args.getValueForOption("--speakers");
    if (speakers.isNotEmpty())
        config.clips.speakers = parseIntList(speakers, "--speakers");

    SceneError error;
    StructureParser parser;
    StructureNode root;
    if (!parser.parseFile(requiredOption(args, "--structure").toStdString(), root, error))
        failOn(error);

    ClipPool pool(config.clips);
    std::string message;
    if (!pool.loadIndexFile(requiredOption(args, "--clips").toStdString(), config.sampleRate,
                            config.clips.speakers, message))
        juce::ConsoleApplication::fail(message, static_cast<int>(ErrorKind::io));

    auto policy = makeTurnPolicy(config.turns);
    SceneGenerator generator(config.generator, pool, *policy);
    juce::Random rng(config.seed);
    std::vector<SceneSegment> segments;
    if (!generator.generate(root, rng, segments, error))
        failOn(error);

    writeText(args, sceneToJson(segments));
}

static void runSessions(const juce::ArgumentList& args)
{
    auto config = loadSettings(args);

    SessionLayout layout;
    layout.tables = parseLayout(args, config);
    layout.numSessions = requiredOption(args, "--sessions").getIntValue();
    auto minTime = args.getValueForOption("--min-speaker-time");
    if (minTime.isNotEmpty())
        layout.minSpeakerTime = minTime.getDoubleValue();
    if (layout.numSessions < 1)
        juce::ConsoleApplication::fail("--sessions must be positive");

    auto indexFile = juce::File::getCurrentWorkingDirectory().getChildFile(requiredOption(args, "--clips"));
    if (!indexFile.existsAsFile())
        juce::ConsoleApplication::fail("File not found: " + indexFile.getFullPathName(),
                                       static_cast<int>(ErrorKind::io));

    SceneError error;
    juce::Random rng(config.seed);
    std::vector<Session> sessions;
    if (!buildSessions(layout, config, indexFile.loadFileAsString().toStdString(), rng,
                       sessions, error))
        failOn(error);

    writeText(args, sessionsToJson(sessions));
}

static void runRender(const juce::ArgumentList& args)
{
    auto config = loadSettings(args);
    auto root = args.getValueForOption("--audio-root");
    if (root.isNotEmpty())
        config.render.audioRoot = root.toStdString();
    auto threads = args.getValueForOption("--threads");
    if (threads.isNotEmpty())
        config.render.threads = threads.getIntValue();

    SceneError error;
    std::vector<SceneSegment> segments;
    if (!readSceneFile(requiredOption(args, "--scene").toStdString(), segments, error))
        failOn(error);

    int channels = 1;
    for (const auto& seg : segments)
        channels = std::max(channels, seg.channel + 1);
    auto channelOption = args.getValueForOption("--channels");
    if (channelOption.isNotEmpty())
        channels = channelOption.getIntValue();

    AudioFileClipReader reader(config.render.audioRoot);
    SceneRenderer renderer(reader, config.render.threads);
    juce::AudioBuffer<float> buffer;
    if (!renderer.render(segments, channels, config.sampleRate, buffer, error))
        failOn(error);

    auto outFile = juce::File::getCurrentWorkingDirectory().getChildFile(requiredOption(args, "--out"));
    outFile.deleteFile();
    auto stream = std::make_unique<juce::FileOutputStream>(outFile);
    if (stream->failedToOpen())
        juce::ConsoleApplication::fail("Cannot open " + outFile.getFullPathName(),
                                       static_cast<int>(ErrorKind::io));

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wavFormat.createWriterFor(stream.get(), config.sampleRate,
                                  static_cast<unsigned int>(buffer.getNumChannels()), 32, {}, 0));
    if (!writer)
        juce::ConsoleApplication::fail("Cannot create WAV writer for " + outFile.getFullPathName(),
                                       static_cast<int>(ErrorKind::io));
    stream.release();

    if (!writer->writeFromAudioSampleBuffer(buffer, 0, buffer.getNumSamples()))
        juce::ConsoleApplication::fail("Failed writing " + outFile.getFullPathName(),
                                       static_cast<int>(ErrorKind::io));

    PL_INFO("render: %d ch x %d samples -> %s", buffer.getNumChannels(), buffer.getNumSamples(),
            outFile.getFullPathName().toRawUTF8());
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;
    app.addHelpCommand("--help|-h", "Usage: parley <command> [--option=value ...]", true);
    app.addVersionCommand("--version|-v", juce::String("parley ") + getVersion());

    app.addCommand({"structure",
                    "structure --tables=4,4,4 --duration=1800 [--segment] [--half-life=600] "
                    "[--min-duration=30] [--seed=N] [--out=structure.json]",
                    "Builds a parallel-tables structure document",
                    "Each table gets consecutive speaker ids. With --segment, tables of four "
                    "or more alternate between one conversation and two side conversations.",
                    runStructure});

    app.addCommand({"generate",
                    "generate --structure=s.json --clips=index.csv [--speakers=id,id,...] "
                    "[--config=c.json] [--seed=N] [--out=scene.json]",
                    "Generates a scene from a structure and a clip index",
                    "The clip index is a CSV with speaker, file_name and length (samples) "
                    "columns. --speakers maps dataset speaker ids onto scene speakers 1..N.",
                    runGenerate});

    app.addCommand({"sessions",
                    "sessions --sessions=N --clips=index.csv --tables=4,4,4 --duration=1800 "
                    "[--segment] [--half-life=600] [--min-duration=30] [--min-speaker-time=S] "
                    "[--config=c.json] [--seed=N] [--out=sessions.json]",
                    "Builds structures, speaker lists and scenes for a batch of sessions",
                    "Dataset speakers with at least --min-speaker-time seconds of clips "
                    "(default half a session) are dealt to sessions without repeats until "
                    "they run out.",
                    runSessions});

    app.addCommand({"render",
                    "render --scene=scene.json --out=scene.wav [--channels=N] [--config=c.json] "
                    "[--audio-root=dir] [--threads=N]",
                    "Renders a scene to a multichannel 32-bit float WAV file",
                    "Channels default to the highest channel in the scene plus one.",
                    runRender});

    return app.findAndRunCommand(juce::ArgumentList(argc, argv), true);
}
