#pragma once

#include "core/SceneError.h"
#include "core/Types.h"

#include <map>
#include <string>
#include <vector>

namespace parley {

/// Immutable per-timeline state threaded through the structure walk.
/// Every operation returns a new context; branches of a splitter each get
/// their own copy, so sibling timelines never share mutable state.
struct TimelineContext {
    double cursor = 0.0;                        // absolute seconds
    std::vector<SpeakerId> scope;               // empty = unrestricted
    std::map<SpeakerId, double> lastTurnEnd;    // per-speaker end of last turn
    SpeakerId lastSpeaker = 0;                  // 0 = nobody has spoken yet

    bool inScope(SpeakerId speaker) const;

    /// End of the speaker's last turn, or 0 if they have not spoken.
    double lastTurnEndFor(SpeakerId speaker) const;
};

/// Copy with the cursor moved forward by `seconds`.
TimelineContext advanced(const TimelineContext& ctx, double seconds);

/// Copy whose scope is `speakers`. Fails with structureFormat if a speaker
/// is outside a non-empty enclosing scope. An empty `speakers` keeps the
/// enclosing scope.
bool restrictScope(const TimelineContext& ctx, const std::vector<SpeakerId>& speakers,
                   const std::string& path, TimelineContext& out, SceneError& error);

/// Join the branches of a splitter that all started from `entry`:
/// cursor = latest branch cursor, last turn ends = per-speaker latest,
/// last speaker = from the branch that ended last (lowest index on ties),
/// scope = entry scope.
TimelineContext mergeBranches(const TimelineContext& entry,
                              const std::vector<TimelineContext>& branches);

} // namespace parley
