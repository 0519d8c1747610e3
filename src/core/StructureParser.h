#pragma once

#include "core/SceneError.h"
#include "core/Structure.h"

#include <juce_core/juce_core.h>

#include <string>

namespace parley {

class StructureParser {
public:
    StructureParser() = default;
    ~StructureParser() = default;

    StructureParser(const StructureParser&) = delete;
    StructureParser& operator=(const StructureParser&) = delete;

    // --- Parsing ---

    /// Parse a structure document. On failure `out` is left untouched and
    /// `error` carries a structureFormat (or io, for parseFile) error.
    bool parse(const std::string& json, StructureNode& out, SceneError& error) const;
    bool parseFile(const std::string& path, StructureNode& out, SceneError& error) const;

    bool parseVar(const juce::var& document, StructureNode& out, SceneError& error) const;

private:
    bool parseNode(const juce::var& v, const std::string& path,
                   StructureNode& out, SceneError& error) const;
    bool parseElements(const juce::var& v, const std::string& path,
                       std::vector<StructureNode>& out, SceneError& error) const;
    bool parseSpeakers(const juce::var& v, const std::string& path, bool required,
                       std::vector<SpeakerId>& out, SceneError& error) const;
    bool parseDuration(const juce::var& v, const std::string& path,
                       double& out, SceneError& error) const;
};

// --- Serialisation ---

juce::var structureToVar(const StructureNode& node);
std::string structureToJson(const StructureNode& node);

} // namespace parley
