#pragma once

#include "core/SceneConfig.h"
#include "core/SceneError.h"
#include "core/SceneSegment.h"
#include "core/Structure.h"
#include "core/StructureBuilder.h"

#include <juce_core/juce_core.h>

#include <map>
#include <string>
#include <vector>

namespace parley {

/// A batch of cafe sessions sharing one table layout.
struct SessionLayout {
    int numSessions = 1;
    TableLayout tables;
    double minSpeakerTime = -1.0;   // seconds of clips a speaker needs; < 0 = half a session
};

struct Session {
    std::string name;               // session_001, session_002, ...
    std::vector<int> speakers;      // dataset ids; speakers[k - 1] plays scene speaker k
    StructureNode structure;
    std::vector<SceneSegment> scene;
};

/// Deal dataset speakers to sessions. Only speakers with at least `minTime`
/// seconds of clips take part. They are dealt from successive shuffles of
/// the eligible set, so sessions share nobody until the set is used up,
/// and no session ever holds a speaker twice. Fails with
/// insufficientSourceMaterial when a session needs more speakers than are
/// eligible.
bool makeSpeakerLists(const std::map<int, double>& speakerTime,
                      const std::vector<int>& perSession, double minTime, juce::Random& rng,
                      std::vector<std::vector<int>>& out, SceneError& error);

/// Build the structures, speaker lists and scenes of every session from
/// one clip index. All draws come from `rng`; each session's scene uses
/// its own fork of it. On failure `out` is left empty.
bool buildSessions(const SessionLayout& layout, const SceneConfig& config,
                   const std::string& clipIndexCsv, juce::Random& rng,
                   std::vector<Session>& out, SceneError& error);

// --- Writing ---

juce::var sessionsToVar(const std::vector<Session>& sessions);
std::string sessionsToJson(const std::vector<Session>& sessions);

} // namespace parley
