#include "core/Timeline.h"
#include "core/Logger.h"

#include <algorithm>

namespace parley {

bool TimelineContext::inScope(SpeakerId speaker) const
{
    if (scope.empty())
        return true;
    return std::find(scope.begin(), scope.end(), speaker) != scope.end();
}

double TimelineContext::lastTurnEndFor(SpeakerId speaker) const
{
    auto it = lastTurnEnd.find(speaker);
    if (it == lastTurnEnd.end())
        return 0.0;
    return it->second;
}

TimelineContext advanced(const TimelineContext& ctx, double seconds)
{
    TimelineContext next = ctx;
    next.cursor += seconds;
    return next;
}

bool restrictScope(const TimelineContext& ctx, const std::vector<SpeakerId>& speakers,
                   const std::string& path, TimelineContext& out, SceneError& error)
{
    if (speakers.empty())
    {
        out = ctx;
        return true;
    }

    for (auto s : speakers)
    {
        if (!ctx.inScope(s))
        {
            error.set(ErrorKind::structureFormat,
                      "speaker " + std::to_string(s) + " is not in the enclosing speaker set",
                      path);
            PL_WARN("restrictScope: %s", error.describe().c_str());
            return false;
        }
    }

    out = ctx;
    out.scope = speakers;
    return true;
}

TimelineContext mergeBranches(const TimelineContext& entry,
                              const std::vector<TimelineContext>& branches)
{
    TimelineContext merged = entry;
    if (branches.empty())
        return merged;

    size_t latest = 0;
    for (size_t i = 0; i < branches.size(); ++i)
    {
        const auto& b = branches[i];
        if (b.cursor > branches[latest].cursor)
            latest = i;

        for (const auto& [speaker, end] : b.lastTurnEnd)
        {
            auto it = merged.lastTurnEnd.find(speaker);
            if (it == merged.lastTurnEnd.end())
                merged.lastTurnEnd[speaker] = end;
            else
                it->second = std::max(it->second, end);
        }
    }

    merged.cursor = std::max(entry.cursor, branches[latest].cursor);
    merged.lastSpeaker = branches[latest].lastSpeaker;

    PL_TRACE("mergeBranches: %d branches, entry=%.3f end=%.3f (branch %d)",
             static_cast<int>(branches.size()), entry.cursor, merged.cursor,
             static_cast<int>(latest));
    return merged;
}

} // namespace parley
