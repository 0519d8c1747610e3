#pragma once

#include "core/SceneError.h"
#include "core/SceneSegment.h"

#include <juce_core/juce_core.h>

#include <string>
#include <vector>

namespace parley {

// --- Writing ---

/// Same segment list, same text.
juce::var sceneToVar(const std::vector<SceneSegment>& segments);
std::string sceneToJson(const std::vector<SceneSegment>& segments);
bool writeSceneFile(const std::string& path, const std::vector<SceneSegment>& segments,
                    SceneError& error);

// --- Reading ---

/// Fails with io on malformed JSON or entries; `segments` is untouched then.
bool sceneFromJson(const std::string& json, std::vector<SceneSegment>& segments,
                   SceneError& error);
bool readSceneFile(const std::string& path, std::vector<SceneSegment>& segments,
                   SceneError& error);

} // namespace parley
