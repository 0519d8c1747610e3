#include "core/StructureParser.h"
#include "core/Logger.h"

#include <algorithm>
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

static std::string childPath(const std::string& path, int index)
{
    return path + ".elements[" + std::to_string(index) + "]";
}

static bool fail(SceneError& error, const std::string& path, const std::string& message)
{
    error.set(ErrorKind::structureFormat, message, path);
    PL_WARN("StructureParser: %s", error.describe().c_str());
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Entry points
// ═══════════════════════════════════════════════════════════════════

bool StructureParser::parse(const std::string& json, StructureNode& out, SceneError& error) const
{
    PL_DEBUG("StructureParser::parse: %d bytes", static_cast<int>(json.size()));

    if (json.empty())
        return fail(error, "", "empty structure document");

    juce::var document;
    auto result = juce::JSON::parse(juce::String(json), document);
    if (result.failed())
        return fail(error, "", "invalid JSON: " + result.getErrorMessage().toStdString());

    return parseVar(document, out, error);
}

bool StructureParser::parseFile(const std::string& path, StructureNode& out, SceneError& error) const
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile())
    {
        error.set(ErrorKind::io, "structure file not found: " + path);
        PL_WARN("StructureParser::parseFile: %s", error.message.c_str());
        return false;
    }

    return parse(file.loadFileAsString().toStdString(), out, error);
}

bool StructureParser::parseVar(const juce::var& document, StructureNode& out, SceneError& error) const
{
    StructureNode root;
    if (!parseNode(document, "root", root, error))
        return false;

    PL_INFO("StructureParser: parsed %d nodes, declared duration %.3fs",
            countNodes(root), declaredDuration(root));
    out = std::move(root);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Nodes
// ═══════════════════════════════════════════════════════════════════

bool StructureParser::parseNode(const juce::var& v, const std::string& path,
                                StructureNode& out, SceneError& error) const
{
    if (!v.isObject())
        return fail(error, path, "node is not an object");

    if (!v.hasProperty("type") || !v["type"].isString())
        return fail(error, path, "missing node type");

    const auto type = v["type"].toString().toStdString();
    PL_TRACE("StructureParser: %s type=%s", path.c_str(), type.c_str());

    if (type == "sequence" || type == "splitter")
    {
        std::vector<SpeakerId> speakers;
        if (!parseSpeakers(v, path, false, speakers, error))
            return false;
        std::vector<StructureNode> elements;
        if (!parseElements(v, path, elements, error))
            return false;

        if (type == "sequence")
            out = StructureNode::sequence(std::move(elements), std::move(speakers));
        else
            out = StructureNode::splitter(std::move(elements), std::move(speakers));
        return true;
    }

    if (type == "conversation")
    {
        std::vector<SpeakerId> speakers;
        if (!parseSpeakers(v, path, true, speakers, error))
            return false;
        if (speakers.size() < 2)
            return fail(error, path, "conversation needs at least 2 speakers");
        double duration = 0.0;
        if (!parseDuration(v, path, duration, error))
            return false;

        out = StructureNode::conversation(std::move(speakers), duration);
        return true;
    }

    if (type == "noise")
    {
        double duration = 0.0;
        if (!parseDuration(v, path, duration, error))
            return false;

        NoiseParams params;
        if (v.hasProperty("params"))
        {
            const auto& p = v["params"];
            if (!p.isObject())
                return fail(error, path, "noise params is not an object");
            if (p.hasProperty("kind"))
            {
                if (!parseNoiseKind(p["kind"].toString().toStdString(), params.kind))
                    return fail(error, path, "unknown noise kind '"
                                + p["kind"].toString().toStdString() + "'");
            }
            if (p.hasProperty("level"))
            {
                if (!isNumber(p["level"]))
                    return fail(error, path, "noise level is not a number");
                const double level = static_cast<double>(p["level"]);
                if (!(level > 0.0 && level <= 1.0))
                    return fail(error, path, "noise level must be in (0, 1]");
                params.level = static_cast<float>(level);
            }
            if (p.hasProperty("talkers"))
            {
                if (!isInteger(p["talkers"]) || static_cast<juce::int64>(p["talkers"]) < 1)
                    return fail(error, path, "babble talkers must be a positive integer");
                params.talkers = static_cast<int>(p["talkers"]);
            }
        }

        // Babble mixes clips of the listed speakers; they are not scene
        // speakers and take no part in scope checks
        std::vector<SpeakerId> sources;
        if (params.kind == NoiseKind::babble)
        {
            if (!parseSpeakers(v, path, true, sources, error))
                return false;
        }
        else if (v.hasProperty("speakers"))
        {
            return fail(error, path, "only babble noise takes speakers");
        }

        ChannelId channel = -1;
        if (v.hasProperty("channel"))
        {
            if (!isInteger(v["channel"]) || static_cast<int>(v["channel"]) < 0)
                return fail(error, path, "noise channel must be a non-negative integer");
            channel = static_cast<int>(v["channel"]);
        }

        out = StructureNode::noise(duration, params, channel, std::move(sources));
        return true;
    }

    if (type == "pause")
    {
        double duration = 0.0;
        if (!parseDuration(v, path, duration, error))
            return false;
        out = StructureNode::pause(duration);
        return true;
    }

    return fail(error, path, "unrecognised node type '" + type + "'");
}

bool StructureParser::parseElements(const juce::var& v, const std::string& path,
                                    std::vector<StructureNode>& out, SceneError& error) const
{
    if (!v.hasProperty("elements"))
        return fail(error, path, "missing elements");

    const auto& elements = v["elements"];
    if (!elements.isArray())
        return fail(error, path, "elements is not an array");
    if (elements.size() == 0)
        return fail(error, path, "elements is empty");

    out.clear();
    out.reserve(static_cast<size_t>(elements.size()));
    for (int i = 0; i < elements.size(); ++i)
    {
        StructureNode child;
        if (!parseNode(elements[i], childPath(path, i), child, error))
            return false;
        out.push_back(std::move(child));
    }
    return true;
}

bool StructureParser::parseSpeakers(const juce::var& v, const std::string& path, bool required,
                                    std::vector<SpeakerId>& out, SceneError& error) const
{
    out.clear();
    if (!v.hasProperty("speakers"))
    {
        if (required)
            return fail(error, path, "missing speakers");
        return true;
    }

    const auto& speakers = v["speakers"];
    if (!speakers.isArray())
        return fail(error, path, "speakers is not an array");

    for (int i = 0; i < speakers.size(); ++i)
    {
        const auto& s = speakers[i];
        if (!isInteger(s) || static_cast<juce::int64>(s) < 1)
            return fail(error, path, "speaker ids must be positive integers");
        const auto id = static_cast<SpeakerId>(static_cast<int>(s));
        if (std::find(out.begin(), out.end(), id) != out.end())
            return fail(error, path, "duplicate speaker " + std::to_string(id));
        out.push_back(id);
    }

    if (required && out.empty())
        return fail(error, path, "speakers is empty");
    return true;
}

bool StructureParser::parseDuration(const juce::var& v, const std::string& path,
                                    double& out, SceneError& error) const
{
    if (!v.hasProperty("duration"))
        return fail(error, path, "missing duration");

    const auto& d = v["duration"];
    if (!isNumber(d))
        return fail(error, path, "duration is not a number");

    const double seconds = static_cast<double>(d);
    if (!std::isfinite(seconds) || seconds < 0.0)
        return fail(error, path, "duration must be a non-negative number");

    out = seconds;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Serialisation
// ═══════════════════════════════════════════════════════════════════

static juce::var speakersToVar(const std::vector<SpeakerId>& speakers)
{
    juce::Array<juce::var> list;
    for (auto s : speakers)
        list.add(s);
    return juce::var(list);
}

static juce::var elementsToVar(const std::vector<StructureNode>& elements)
{
    juce::Array<juce::var> list;
    for (const auto& child : elements)
        list.add(structureToVar(child));
    return juce::var(list);
}

juce::var structureToVar(const StructureNode& node)
{
    juce::DynamicObject::Ptr obj(new juce::DynamicObject());
    obj->setProperty("type", juce::String(nodeTypeName(node)));

    std::visit(Overloaded{
        [&](const SequenceNode& n) {
            if (!n.speakers.empty())
                obj->setProperty("speakers", speakersToVar(n.speakers));
            obj->setProperty("elements", elementsToVar(n.elements));
        },
        [&](const SplitterNode& n) {
            if (!n.speakers.empty())
                obj->setProperty("speakers", speakersToVar(n.speakers));
            obj->setProperty("elements", elementsToVar(n.elements));
        },
        [&](const ConversationNode& n) {
            obj->setProperty("speakers", speakersToVar(n.speakers));
            obj->setProperty("duration", n.duration);
        },
        [&](const NoiseNode& n) {
            obj->setProperty("duration", n.duration);
            juce::DynamicObject::Ptr params(new juce::DynamicObject());
            params->setProperty("kind", juce::String(noiseKindName(n.params.kind)));
            params->setProperty("level", static_cast<double>(n.params.level));
            if (n.params.kind == NoiseKind::babble)
            {
                params->setProperty("talkers", n.params.talkers);
                obj->setProperty("speakers", speakersToVar(n.sources));
            }
            obj->setProperty("params", juce::var(params.get()));
            if (n.channel >= 0)
                obj->setProperty("channel", n.channel);
        },
        [&](const PauseNode& n) {
            obj->setProperty("duration", n.duration);
        },
    }, node.value);

    return juce::var(obj.get());
}

std::string structureToJson(const StructureNode& node)
{
    return juce::JSON::toString(structureToVar(node)).toStdString();
}

} // namespace parley
