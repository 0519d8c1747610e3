#include "ffi/parley_ffi.h"
#include "core/AudioFileClipReader.h"
#include "core/ClipPool.h"
#include "core/Logger.h"
#include "core/SceneConfig.h"
#include "core/SceneFile.h"
#include "core/SceneGenerator.h"
#include "core/SceneRenderer.h"
#include "core/StructureBuilder.h"
#include "core/StructureParser.h"

#include <cstdlib>
#include <cstring>
#include <exception>

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

static int fail(char** error, const parley::SceneError& err)
{
    set_error(error, err.describe());
    return static_cast<int>(err.kind);
}

// The current level is the default, so a config without logLevel keeps
// whatever pl_set_log_level chose
static bool load_config(const char* config_json, parley::SceneConfig& config,
                        parley::SceneError& err)
{
    config.logLevel = parley::Logger::getLevel();
    if (config_json && !parley::loadConfig(config_json, config, err))
        return false;
    parley::Logger::setLevel(config.logLevel);
    return true;
}

// --- Logger API ---

void pl_set_log_level(int level)
{
    if (level < 0) level = 0;
    if (level > 4) level = 4;
    parley::Logger::setLevel(static_cast<parley::LogLevel>(level));
}

void pl_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    parley::Logger::setCallback(callback, user_data);
}

// --- String free ---

void pl_free_string(char* s)
{
    free(s);
}

char* pl_version(void)
{
    return to_c_string(parley::getVersion());
}

// ═══════════════════════════════════════════════════════════════════
// Structure
// ═══════════════════════════════════════════════════════════════════

char* pl_build_structure(const int* table_sizes, int num_tables, int duration,
                         bool segment, double half_life, int min_duration,
                         int64_t seed, char** error)
{
    if ((num_tables > 0 && !table_sizes) || num_tables < 0 || duration <= 0 || !(half_life > 0.0))
    {
        set_error(error, "Invalid table layout");
        return nullptr;
    }

    try
    {
        parley::TableLayout layout;
        layout.tableSizes.assign(table_sizes, table_sizes + num_tables);
        layout.duration = duration;
        layout.segment = segment;
        layout.halfLife = half_life;
        layout.minDuration = min_duration;

        juce::Random rng(static_cast<juce::int64>(seed));
        return to_c_string(parley::structureToJson(
            parley::makeParallelConversations(layout, rng)));
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return nullptr;
    }
}

// ═══════════════════════════════════════════════════════════════════
// Generation
// ═══════════════════════════════════════════════════════════════════

int pl_generate(const char* structure_json, const char* clip_index_csv,
                const char* config_json, char** scene_json, char** error)
{
    if (!structure_json || !clip_index_csv || !scene_json)
    {
        set_error(error, "structure_json, clip_index_csv and scene_json are required");
        return PL_IO_ERROR;
    }

    try
    {
        parley::SceneConfig config;
        parley::SceneError err;
        if (!load_config(config_json, config, err))
            return fail(error, err);

        parley::StructureParser parser;
        parley::StructureNode root;
        if (!parser.parse(structure_json, root, err))
            return fail(error, err);

        parley::ClipPool pool(config.clips);
        std::string msg;
        if (!pool.loadIndex(clip_index_csv, config.sampleRate, config.clips.speakers, msg))
        {
            err.set(parley::ErrorKind::io, msg);
            return fail(error, err);
        }

        auto policy = parley::makeTurnPolicy(config.turns);
        parley::SceneGenerator generator(config.generator, pool, *policy);
        juce::Random rng(config.seed);
        std::vector<parley::SceneSegment> segments;
        if (!generator.generate(root, rng, segments, err))
            return fail(error, err);

        *scene_json = to_c_string(parley::sceneToJson(segments));
        return PL_OK;
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return PL_IO_ERROR;
    }
}

// ═══════════════════════════════════════════════════════════════════
// Rendering
// ═══════════════════════════════════════════════════════════════════

int pl_render(const char* scene_json, int channel_count, const char* config_json,
              PlSampleBuffer* out, char** error)
{
    if (!scene_json || !out)
    {
        set_error(error, "scene_json and out are required");
        return PL_IO_ERROR;
    }
    *out = PlSampleBuffer{nullptr, 0, 0, 0.0};

    try
    {
        parley::SceneConfig config;
        parley::SceneError err;
        if (!load_config(config_json, config, err))
            return fail(error, err);

        std::vector<parley::SceneSegment> segments;
        if (!parley::sceneFromJson(scene_json, segments, err))
            return fail(error, err);

        parley::AudioFileClipReader reader(config.render.audioRoot);
        parley::SceneRenderer renderer(reader, config.render.threads);
        juce::AudioBuffer<float> buffer;
        if (!renderer.render(segments, channel_count, config.sampleRate, buffer, err))
            return fail(error, err);

        const int numChannels = buffer.getNumChannels();
        const int numSamples = buffer.getNumSamples();
        const size_t total = static_cast<size_t>(numChannels) * static_cast<size_t>(numSamples);
        float* data = nullptr;
        if (total > 0)
        {
            data = static_cast<float*>(malloc(total * sizeof(float)));
            if (!data)
            {
                set_error(error, "Out of memory for rendered buffer");
                return PL_IO_ERROR;
            }
            for (int ch = 0; ch < numChannels; ++ch)
                std::memcpy(data + static_cast<size_t>(ch) * static_cast<size_t>(numSamples),
                            buffer.getReadPointer(ch),
                            static_cast<size_t>(numSamples) * sizeof(float));
        }

        out->data = data;
        out->num_channels = numChannels;
        out->num_samples = numSamples;
        out->sample_rate = config.sampleRate;
        return PL_OK;
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return PL_IO_ERROR;
    }
}

void pl_free_sample_buffer(PlSampleBuffer* buffer)
{
    if (!buffer) return;
    free(buffer->data);
    buffer->data = nullptr;
    buffer->num_channels = 0;
    buffer->num_samples = 0;
}
