#include "core/SceneConfig.h"

#include <cmath>
#include <utility>

namespace parley {

static bool isNumber(const juce::var& v)
{
    return v.isInt() || v.isInt64() || v.isDouble();
}

static bool isInteger(const juce::var& v)
{
    return v.isInt() || v.isInt64();
}

static bool fail(SceneError& error, const std::string& message)
{
    error.set(ErrorKind::io, message);
    PL_WARN("SceneConfig: %s", error.message.c_str());
    return false;
}

// Each reader leaves `out` alone when the key is absent

static bool readDouble(const juce::var& obj, const char* key, double& out, SceneError& error)
{
    const auto& v = obj[key];
    if (v.isVoid())
        return true;
    if (!isNumber(v) || !std::isfinite(static_cast<double>(v)))
        return fail(error, std::string("'") + key + "' must be a number");
    out = static_cast<double>(v);
    return true;
}

static bool readInt(const juce::var& obj, const char* key, int& out, SceneError& error)
{
    const auto& v = obj[key];
    if (v.isVoid())
        return true;
    if (!isInteger(v))
        return fail(error, std::string("'") + key + "' must be an integer");
    out = static_cast<int>(v);
    return true;
}

static bool readBool(const juce::var& obj, const char* key, bool& out, SceneError& error)
{
    const auto& v = obj[key];
    if (v.isVoid())
        return true;
    if (!v.isBool())
        return fail(error, std::string("'") + key + "' must be true or false");
    out = static_cast<bool>(v);
    return true;
}

static bool readString(const juce::var& obj, const char* key, std::string& out, SceneError& error)
{
    const auto& v = obj[key];
    if (v.isVoid())
        return true;
    if (!v.isString())
        return fail(error, std::string("'") + key + "' must be a string");
    out = v.toString().toStdString();
    return true;
}

static bool readSection(const juce::var& obj, const char* key, juce::var& out, SceneError& error)
{
    out = obj[key];
    if (out.isVoid() || out.isObject())
        return true;
    return fail(error, std::string("'") + key + "' must be an object");
}

// ═══════════════════════════════════════════════════════════════════
// Sections
// ═══════════════════════════════════════════════════════════════════

static bool readSpeakerChannels(const juce::var& v, std::map<SpeakerId, ChannelId>& out,
                                SceneError& error)
{
    if (v.isVoid())
        return true;
    auto* obj = v.getDynamicObject();
    if (obj == nullptr)
        return fail(error, "'speakerChannels' must be an object of speaker -> channel");

    std::map<SpeakerId, ChannelId> channels;
    for (const auto& entry : obj->getProperties())
    {
        const auto key = entry.name.toString();
        if (key.isEmpty() || !key.containsOnly("0123456789") || key.getIntValue() < 1)
            return fail(error, "speakerChannels key '" + key.toStdString()
                        + "' is not a positive speaker id");
        if (!isInteger(entry.value) || static_cast<int>(entry.value) < 0)
            return fail(error, "speakerChannels['" + key.toStdString()
                        + "'] must be a non-negative integer");
        channels[key.getIntValue()] = static_cast<int>(entry.value);
    }

    out = std::move(channels);
    return true;
}

static bool readTurns(const juce::var& v, TurnSettings& turns, SceneError& error)
{
    if (v.isVoid())
        return true;

    std::string policy = turnOrderName(turns.order);
    if (!readString(v, "policy", policy, error))
        return false;
    if (!parseTurnOrder(policy, turns.order))
        return fail(error, "unknown turn policy '" + policy + "'");

    return readDouble(v, "minTurn", turns.minTurn, error)
        && readDouble(v, "maxTurn", turns.maxTurn, error)
        && readDouble(v, "gapStdDev", turns.gapStdDev, error)
        && readDouble(v, "maxOverlap", turns.maxOverlap, error)
        && readDouble(v, "maxGap", turns.maxGap, error);
}

static bool readClips(const juce::var& v, ClipSettings& clips, SceneError& error)
{
    if (v.isVoid())
        return true;
    if (!readBool(v, "allowReuse", clips.allowReuse, error)
        || !readBool(v, "randomOffset", clips.randomOffset, error))
        return false;

    const auto& speakers = v["speakers"];
    if (speakers.isVoid())
        return true;
    auto* list = speakers.getArray();
    if (list == nullptr)
        return fail(error, "'clips.speakers' must be an array of dataset speaker ids");

    std::vector<int> ids;
    for (const auto& id : *list)
    {
        if (!isInteger(id) || static_cast<int>(id) < 0)
            return fail(error, "'clips.speakers' entries must be non-negative integers");
        ids.push_back(static_cast<int>(id));
    }
    clips.speakers = std::move(ids);
    return true;
}

static bool readRender(const juce::var& v, RenderSettings& render, SceneError& error)
{
    if (v.isVoid())
        return true;
    return readInt(v, "threads", render.threads, error)
        && readString(v, "audioRoot", render.audioRoot, error);
}

// ═══════════════════════════════════════════════════════════════════
// Entry points
// ═══════════════════════════════════════════════════════════════════

bool validateConfig(const SceneConfig& config, SceneError& error)
{
    const auto& t = config.turns;
    if (!(config.sampleRate > 0.0))
        return fail(error, "sampleRate must be > 0");
    if (config.generator.noiseChannel < 0)
        return fail(error, "noiseChannel must be >= 0");
    if (!(t.minTurn > 0.0))
        return fail(error, "turns.minTurn must be > 0");
    if (t.maxTurn < t.minTurn)
        return fail(error, "turns.maxTurn must be >= turns.minTurn");
    if (t.maxOverlap < 0.0 || t.maxOverlap >= t.minTurn)
        return fail(error, "turns.maxOverlap must be in [0, minTurn)");
    if (t.maxGap < 0.0)
        return fail(error, "turns.maxGap must be >= 0");
    if (t.gapStdDev < 0.0)
        return fail(error, "turns.gapStdDev must be >= 0");
    if (config.render.threads < 0)
        return fail(error, "render.threads must be >= 0");
    return true;
}

bool loadConfig(const std::string& json, SceneConfig& config, SceneError& error)
{
    juce::var document;
    auto result = juce::JSON::parse(juce::String(json), document);
    if (result.failed())
        return fail(error, "invalid config JSON: " + result.getErrorMessage().toStdString());
    if (!document.isObject())
        return fail(error, "config document must be an object");

    SceneConfig loaded = config;

    const auto& seed = document["seed"];
    if (!seed.isVoid())
    {
        if (!isInteger(seed))
            return fail(error, "'seed' must be an integer");
        loaded.seed = static_cast<juce::int64>(seed);
    }

    std::string level;
    juce::var turns, clips, render;
    if (!readDouble(document, "sampleRate", loaded.sampleRate, error)
        || !readInt(document, "noiseChannel", loaded.generator.noiseChannel, error)
        || !readSpeakerChannels(document["speakerChannels"], loaded.generator.speakerChannels, error)
        || !readSection(document, "turns", turns, error)
        || !readTurns(turns, loaded.turns, error)
        || !readSection(document, "clips", clips, error)
        || !readClips(clips, loaded.clips, error)
        || !readSection(document, "render", render, error)
        || !readRender(render, loaded.render, error)
        || !readString(document, "logLevel", level, error))
        return false;

    if (!level.empty() && !Logger::parseLevel(level.c_str(), loaded.logLevel))
        return fail(error, "unknown logLevel '" + level + "'");

    if (!validateConfig(loaded, error))
        return false;

    PL_DEBUG("SceneConfig: seed=%lld sampleRate=%.1f policy=%s threads=%d",
             static_cast<long long>(loaded.seed), loaded.sampleRate,
             turnOrderName(loaded.turns.order), loaded.render.threads);
    config = std::move(loaded);
    return true;
}

bool loadConfigFile(const std::string& path, SceneConfig& config, SceneError& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile())
        return fail(error, "config file not found: " + path);

    return loadConfig(file.loadFileAsString().toStdString(), config, error);
}

std::string configToJson(const SceneConfig& config)
{
    juce::DynamicObject::Ptr channels(new juce::DynamicObject());
    for (const auto& [speaker, channel] : config.generator.speakerChannels)
        channels->setProperty(juce::Identifier(juce::String(speaker)), channel);

    juce::DynamicObject::Ptr turns(new juce::DynamicObject());
    turns->setProperty("policy", juce::String(turnOrderName(config.turns.order)));
    turns->setProperty("minTurn", config.turns.minTurn);
    turns->setProperty("maxTurn", config.turns.maxTurn);
    turns->setProperty("gapStdDev", config.turns.gapStdDev);
    turns->setProperty("maxOverlap", config.turns.maxOverlap);
    turns->setProperty("maxGap", config.turns.maxGap);

    juce::DynamicObject::Ptr clips(new juce::DynamicObject());
    clips->setProperty("allowReuse", config.clips.allowReuse);
    clips->setProperty("randomOffset", config.clips.randomOffset);
    if (!config.clips.speakers.empty())
    {
        juce::Array<juce::var> ids;
        for (int id : config.clips.speakers)
            ids.add(id);
        clips->setProperty("speakers", juce::var(ids));
    }

    juce::DynamicObject::Ptr render(new juce::DynamicObject());
    render->setProperty("threads", config.render.threads);
    render->setProperty("audioRoot", juce::String(config.render.audioRoot));

    static const char* levelNames[] = {"off", "warn", "info", "debug", "trace"};

    juce::DynamicObject::Ptr obj(new juce::DynamicObject());
    obj->setProperty("seed", config.seed);
    obj->setProperty("sampleRate", config.sampleRate);
    obj->setProperty("noiseChannel", config.generator.noiseChannel);
    obj->setProperty("speakerChannels", juce::var(channels.get()));
    obj->setProperty("turns", juce::var(turns.get()));
    obj->setProperty("clips", juce::var(clips.get()));
    obj->setProperty("render", juce::var(render.get()));
    obj->setProperty("logLevel", juce::String(levelNames[static_cast<int>(config.logLevel)]));
    return juce::JSON::toString(juce::var(obj.get())).toStdString();
}

} // namespace parley
