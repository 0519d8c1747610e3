#pragma once

#include "core/ClipPool.h"
#include "core/Logger.h"
#include "core/SceneError.h"
#include "core/SceneGenerator.h"
#include "core/TurnPolicy.h"

#include <string>

namespace parley {

struct RenderSettings {
    int threads = 1;            // <= 1 renders inline
    std::string audioRoot;      // clip paths are resolved against this
};

/// Every option that affects generation or rendering. Passed explicitly;
/// there is no process-wide default configuration.
struct SceneConfig {
    juce::int64 seed = 0;
    double sampleRate = 16000.0;
    GeneratorSettings generator;
    TurnSettings turns;
    ClipSettings clips;
    RenderSettings render;
    LogLevel logLevel = LogLevel::warn;
};

/// Overlay the options in a JSON object onto `config`. Absent keys keep
/// their current value. Fails with io on malformed JSON, a wrongly typed
/// value or an out-of-range setting; `config` is untouched then.
bool loadConfig(const std::string& json, SceneConfig& config, SceneError& error);
bool loadConfigFile(const std::string& path, SceneConfig& config, SceneError& error);

/// Range checks shared by the loader and programmatic callers.
bool validateConfig(const SceneConfig& config, SceneError& error);

std::string configToJson(const SceneConfig& config);

} // namespace parley
