#include "core/SceneFile.h"
#include "core/Logger.h"

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

static bool fail(SceneError& error, int index, const std::string& message)
{
    error.set(ErrorKind::io, message, "", index);
    PL_WARN("SceneFile: %s", error.describe().c_str());
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════════════

static juce::var segmentToVar(const SceneSegment& seg)
{
    juce::DynamicObject::Ptr obj(new juce::DynamicObject());
    obj->setProperty("start", seg.start);
    obj->setProperty("end", seg.end);
    obj->setProperty("channel", seg.channel);

    if (auto* file = std::get_if<FileRef>(&seg.payload))
    {
        obj->setProperty("kind", "file");
        obj->setProperty("speaker", seg.speaker);
        obj->setProperty("path", juce::String(file->path));
        obj->setProperty("clip_offset", file->clipOffset);
    }
    else
    {
        const auto& gen = std::get<GeneratorRef>(seg.payload);
        obj->setProperty("kind", "generator");
        juce::DynamicObject::Ptr params(new juce::DynamicObject());
        params->setProperty("kind", juce::String(noiseKindName(gen.params.kind)));
        params->setProperty("level", static_cast<double>(gen.params.level));
        params->setProperty("seed", gen.seed);
        if (gen.params.kind == NoiseKind::babble)
        {
            params->setProperty("talkers", gen.params.talkers);
            juce::Array<juce::var> clips;
            for (const auto& clip : gen.clips)
            {
                juce::DynamicObject::Ptr c(new juce::DynamicObject());
                c->setProperty("path", juce::String(clip.path));
                c->setProperty("clip_offset", clip.clipOffset);
                c->setProperty("at", clip.at);
                c->setProperty("length", clip.length);
                clips.add(juce::var(c.get()));
            }
            params->setProperty("clips", juce::var(clips));
        }
        obj->setProperty("generator_params", juce::var(params.get()));
    }

    return juce::var(obj.get());
}

juce::var sceneToVar(const std::vector<SceneSegment>& segments)
{
    juce::Array<juce::var> list;
    for (const auto& seg : segments)
        list.add(segmentToVar(seg));
    return juce::var(list);
}

std::string sceneToJson(const std::vector<SceneSegment>& segments)
{
    return juce::JSON::toString(sceneToVar(segments)).toStdString();
}

bool writeSceneFile(const std::string& path, const std::vector<SceneSegment>& segments,
                    SceneError& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.replaceWithText(juce::String(sceneToJson(segments))))
    {
        error.set(ErrorKind::io, "cannot write scene file: " + path);
        PL_WARN("writeSceneFile: %s", error.message.c_str());
        return false;
    }

    PL_INFO("writeSceneFile: %d segments -> %s",
            static_cast<int>(segments.size()), file.getFullPathName().toRawUTF8());
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Reading
// ═══════════════════════════════════════════════════════════════════

static bool babbleFromVar(const juce::var& params, int index, GeneratorRef& ref, SceneError& error)
{
    const auto& talkers = params["talkers"];
    if (!isInteger(talkers) || static_cast<int>(talkers) < 1)
        return fail(error, index, "babble talkers must be a positive integer");
    ref.params.talkers = static_cast<int>(talkers);

    auto* clips = params["clips"].getArray();
    if (clips == nullptr)
        return fail(error, index, "babble entry needs a clips array");

    for (const auto& c : *clips)
    {
        if (!c.isObject() || !c["path"].isString() || c["path"].toString().isEmpty())
            return fail(error, index, "babble clip needs a path");
        if (!isNumber(c["clip_offset"]) || !isNumber(c["at"]) || !isNumber(c["length"]))
            return fail(error, index, "babble clip needs clip_offset, at and length");

        BabbleClip clip;
        clip.path = c["path"].toString().toStdString();
        clip.clipOffset = static_cast<double>(c["clip_offset"]);
        clip.at = static_cast<double>(c["at"]);
        clip.length = static_cast<double>(c["length"]);
        if (clip.clipOffset < 0.0 || clip.at < 0.0 || !(clip.length > 0.0))
            return fail(error, index, "babble clip times out of range");
        ref.clips.push_back(std::move(clip));
    }
    return true;
}

static bool segmentFromVar(const juce::var& v, int index, SceneSegment& out, SceneError& error)
{
    if (!v.isObject())
        return fail(error, index, "scene entry is not an object");

    const auto& start = v["start"];
    const auto& end = v["end"];
    const auto& channel = v["channel"];
    if (!isNumber(start) || !isNumber(end))
        return fail(error, index, "start and end must be numbers");
    if (!isInteger(channel) || static_cast<int>(channel) < 0)
        return fail(error, index, "channel must be a non-negative integer");

    SceneSegment seg;
    seg.start = static_cast<double>(start);
    seg.end = static_cast<double>(end);
    seg.channel = static_cast<int>(channel);
    if (!std::isfinite(seg.start) || !std::isfinite(seg.end) || seg.start < 0.0)
        return fail(error, index, "start and end must be finite and start >= 0");
    if (seg.end <= seg.start)
        return fail(error, index, "end must be greater than start");

    const auto kind = v["kind"].toString().toStdString();
    if (kind == "file")
    {
        const auto& speaker = v["speaker"];
        const auto& path = v["path"];
        if (!isInteger(speaker) || static_cast<int>(speaker) < 1)
            return fail(error, index, "file entry needs a positive speaker");
        if (!path.isString() || path.toString().isEmpty())
            return fail(error, index, "file entry needs a path");

        FileRef ref;
        ref.path = path.toString().toStdString();
        const auto& offset = v["clip_offset"];
        if (!offset.isVoid())
        {
            if (!isNumber(offset) || static_cast<double>(offset) < 0.0)
                return fail(error, index, "clip_offset must be a non-negative number");
            ref.clipOffset = static_cast<double>(offset);
        }
        seg.speaker = static_cast<int>(speaker);
        seg.payload = std::move(ref);
    }
    else if (kind == "generator")
    {
        const auto& params = v["generator_params"];
        if (!params.isObject())
            return fail(error, index, "generator entry needs generator_params");

        GeneratorRef ref;
        if (!parseNoiseKind(params["kind"].toString().toStdString(), ref.params.kind))
            return fail(error, index, "unknown generator kind '"
                        + params["kind"].toString().toStdString() + "'");
        const auto& level = params["level"];
        if (!isNumber(level) || !(static_cast<double>(level) > 0.0)
            || static_cast<double>(level) > 1.0)
            return fail(error, index, "generator level must be in (0, 1]");
        if (!isInteger(params["seed"]))
            return fail(error, index, "generator seed must be an integer");
        ref.params.level = static_cast<float>(static_cast<double>(level));
        ref.seed = static_cast<int>(params["seed"]);
        if (ref.params.kind == NoiseKind::babble
            && !babbleFromVar(params, index, ref, error))
            return false;
        seg.payload = std::move(ref);
    }
    else
    {
        return fail(error, index, "unknown entry kind '" + kind + "'");
    }

    out = std::move(seg);
    return true;
}

bool sceneFromJson(const std::string& json, std::vector<SceneSegment>& segments,
                   SceneError& error)
{
    juce::var document;
    auto result = juce::JSON::parse(juce::String(json), document);
    if (result.failed())
        return fail(error, -1, "invalid scene JSON: " + result.getErrorMessage().toStdString());

    auto* list = document.getArray();
    if (list == nullptr)
        return fail(error, -1, "scene document must be an array");

    std::vector<SceneSegment> parsed;
    parsed.reserve(static_cast<size_t>(list->size()));
    for (int i = 0; i < list->size(); ++i)
    {
        SceneSegment seg;
        if (!segmentFromVar(list->getReference(i), i, seg, error))
            return false;
        parsed.push_back(std::move(seg));
    }

    PL_DEBUG("sceneFromJson: %d segments", static_cast<int>(parsed.size()));
    segments = std::move(parsed);
    return true;
}

bool readSceneFile(const std::string& path, std::vector<SceneSegment>& segments,
                   SceneError& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile())
    {
        error.set(ErrorKind::io, "scene file not found: " + path);
        PL_WARN("readSceneFile: %s", error.message.c_str());
        return false;
    }

    return sceneFromJson(file.loadFileAsString().toStdString(), segments, error);
}

} // namespace parley
