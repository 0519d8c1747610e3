#include "core/SessionBuilder.h"
#include "core/ClipPool.h"
#include "core/Logger.h"
#include "core/SceneFile.h"
#include "core/SceneGenerator.h"
#include "core/StructureParser.h"

#include <algorithm>
#include <deque>
#include <numeric>
#include <utility>

namespace parley {

static void shuffle(std::vector<int>& ids, juce::Random& rng)
{
    for (int i = static_cast<int>(ids.size()) - 1; i > 0; --i)
        std::swap(ids[static_cast<size_t>(i)], ids[static_cast<size_t>(rng.nextInt(i + 1))]);
}

// ═══════════════════════════════════════════════════════════════════
// Speaker lists
// ═══════════════════════════════════════════════════════════════════

bool makeSpeakerLists(const std::map<int, double>& speakerTime,
                      const std::vector<int>& perSession, double minTime, juce::Random& rng,
                      std::vector<std::vector<int>>& out, SceneError& error)
{
    std::vector<int> eligible;
    for (const auto& [speaker, seconds] : speakerTime)
    {
        if (seconds >= minTime)
            eligible.push_back(speaker);
    }

    const int largest = perSession.empty() ? 0
                        : *std::max_element(perSession.begin(), perSession.end());
    if (largest > static_cast<int>(eligible.size()))
    {
        error.set(ErrorKind::insufficientSourceMaterial,
                  "a session needs " + std::to_string(largest) + " speakers but only "
                  + std::to_string(eligible.size()) + " have "
                  + juce::String(minTime, 1).toStdString() + "s of clips");
        PL_WARN("makeSpeakerLists: %s", error.message.c_str());
        return false;
    }

    std::deque<int> pool;
    int deals = 0;
    auto refill = [&]() {
        auto ids = eligible;
        shuffle(ids, rng);
        pool.insert(pool.end(), ids.begin(), ids.end());
        ++deals;
    };

    std::vector<std::vector<int>> lists;
    for (int count : perSession)
    {
        std::vector<int> list;
        while (static_cast<int>(list.size()) < count)
        {
            auto it = std::find_if(pool.begin(), pool.end(), [&list](int id) {
                return std::find(list.begin(), list.end(), id) == list.end();
            });
            if (it == pool.end())
            {
                refill();
                continue;
            }
            list.push_back(*it);
            pool.erase(it);
        }
        lists.push_back(std::move(list));
    }

    if (deals > 1)
        PL_WARN("makeSpeakerLists: %d eligible speakers dealt %d times, sessions share speakers",
                static_cast<int>(eligible.size()), deals);
    PL_INFO("makeSpeakerLists: %d sessions from %d eligible speakers",
            static_cast<int>(lists.size()), static_cast<int>(eligible.size()));
    out = std::move(lists);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Sessions
// ═══════════════════════════════════════════════════════════════════

bool buildSessions(const SessionLayout& layout, const SceneConfig& config,
                   const std::string& clipIndexCsv, juce::Random& rng,
                   std::vector<Session>& out, SceneError& error)
{
    out.clear();
    if (layout.numSessions < 1 || layout.tables.duration <= 0)
    {
        error.set(ErrorKind::io, "sessions need a positive count and duration");
        PL_WARN("buildSessions: %s", error.message.c_str());
        return false;
    }

    ClipPool dataset;
    std::string message;
    if (!dataset.loadIndex(clipIndexCsv, config.sampleRate, {}, message))
    {
        error.set(ErrorKind::io, message);
        return false;
    }

    std::map<int, double> speakerTime;
    for (auto speaker : dataset.getSpeakers())
        speakerTime[speaker] = dataset.getTotalDuration(speaker);

    auto tables = layout.tables;
    tables.minTurn = config.turns.minTurn;
    const int perSession = std::accumulate(tables.tableSizes.begin(), tables.tableSizes.end(), 0);

    std::vector<Session> sessions(static_cast<size_t>(layout.numSessions));
    for (size_t i = 0; i < sessions.size(); ++i)
    {
        sessions[i].name = "session_" + juce::String(static_cast<int>(i) + 1).paddedLeft('0', 3).toStdString();
        sessions[i].structure = makeParallelConversations(tables, rng);
    }

    const double minTime = layout.minSpeakerTime >= 0.0 ? layout.minSpeakerTime
                                                         : tables.duration / 2.0;
    std::vector<std::vector<int>> lists;
    if (!makeSpeakerLists(speakerTime, std::vector<int>(sessions.size(), perSession), minTime,
                          rng, lists, error))
        return false;

    auto policy = makeTurnPolicy(config.turns);
    for (size_t i = 0; i < sessions.size(); ++i)
    {
        auto& session = sessions[i];
        session.speakers = lists[i];

        ClipPool pool(config.clips);
        if (!pool.loadIndex(clipIndexCsv, config.sampleRate, session.speakers, message))
        {
            error.set(ErrorKind::io, session.name + ": " + message);
            PL_WARN("buildSessions: %s", error.message.c_str());
            return false;
        }

        SceneGenerator generator(config.generator, pool, *policy);
        juce::Random sessionRng(rng.nextInt64());
        if (!generator.generate(session.structure, sessionRng, session.scene, error))
        {
            error.message = session.name + ": " + error.message;
            PL_WARN("buildSessions: %s", error.describe().c_str());
            return false;
        }
        PL_DEBUG("buildSessions: %s, %d segments", session.name.c_str(),
                 static_cast<int>(session.scene.size()));
    }

    PL_INFO("buildSessions: %d sessions of %d speakers, %ds each",
            layout.numSessions, perSession, tables.duration);
    out = std::move(sessions);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════════════

juce::var sessionsToVar(const std::vector<Session>& sessions)
{
    juce::Array<juce::var> list;
    for (const auto& session : sessions)
    {
        juce::DynamicObject::Ptr obj(new juce::DynamicObject());
        obj->setProperty("session", juce::String(session.name));
        obj->setProperty("duration", declaredDuration(session.structure));

        juce::Array<juce::var> speakers;
        for (auto id : session.speakers)
            speakers.add(id);
        obj->setProperty("speakers", juce::var(speakers));
        obj->setProperty("structure", structureToVar(session.structure));
        obj->setProperty("scene", sceneToVar(session.scene));
        list.add(juce::var(obj.get()));
    }
    return juce::var(list);
}

std::string sessionsToJson(const std::vector<Session>& sessions)
{
    return juce::JSON::toString(sessionsToVar(sessions)).toStdString();
}

} // namespace parley
