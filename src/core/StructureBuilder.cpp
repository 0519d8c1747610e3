#include "core/StructureBuilder.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace parley {

std::vector<std::vector<SpeakerId>> makeSpeakerGroups(const std::vector<int>& tableSizes)
{
    std::vector<std::vector<SpeakerId>> groups;
    SpeakerId next = 1;
    for (int size : tableSizes)
    {
        std::vector<SpeakerId> group;
        for (int i = 0; i < size; ++i)
            group.push_back(next++);
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<int> exponentialSegments(double halfLife, int minDuration, int duration,
                                     juce::Random& rng)
{
    std::vector<int> durations;
    const int floorLength = std::max(1, minDuration);
    int elapsed = 0;
    while (elapsed < duration)
    {
        const double draw = -halfLife * std::log(1.0 - rng.nextDouble());
        int length = std::max(static_cast<int>(draw), floorLength);
        if (duration - elapsed - length < floorLength)
            length = duration - elapsed;
        durations.push_back(length);
        elapsed += length;
    }
    return durations;
}

static void shuffle(std::vector<SpeakerId>& speakers, juce::Random& rng)
{
    for (int i = static_cast<int>(speakers.size()) - 1; i > 0; --i)
        std::swap(speakers[static_cast<size_t>(i)],
                  speakers[static_cast<size_t>(rng.nextInt(i + 1))]);
}

StructureNode makeTable(const std::vector<SpeakerId>& speakers, const TableLayout& layout,
                        juce::Random& rng)
{
    const double duration = static_cast<double>(layout.duration);
    if (speakers.size() < 2)
    {
        PL_WARN("makeTable: table of %d speaker(s) stays silent", static_cast<int>(speakers.size()));
        return StructureNode::pause(duration);
    }

    if (speakers.size() < 4 || !layout.segment)
        return StructureNode::conversation(speakers, duration);

    const int seated = static_cast<int>(std::ceil(static_cast<double>(speakers.size()) * layout.minTurn));
    const auto durations = exponentialSegments(layout.halfLife,
                                               std::max(layout.minDuration, seated),
                                               layout.duration, rng);
    std::vector<StructureNode> elements;
    for (size_t i = 0; i < durations.size(); ++i)
    {
        const double d = static_cast<double>(durations[i]);
        if (i % 2 == 0)
        {
            elements.push_back(StructureNode::conversation(speakers, d));
            continue;
        }

        auto shuffled = speakers;
        shuffle(shuffled, rng);
        std::vector<SpeakerId> first(shuffled.begin(), shuffled.begin() + 2);
        std::vector<SpeakerId> rest(shuffled.begin() + 2, shuffled.end());
        elements.push_back(StructureNode::splitter({
            StructureNode::conversation(std::move(first), d),
            StructureNode::conversation(std::move(rest), d),
        }));
    }

    PL_DEBUG("makeTable: %d speakers, %d segments", static_cast<int>(speakers.size()),
             static_cast<int>(elements.size()));
    return StructureNode::sequence(std::move(elements), speakers);
}

StructureNode makeParallelConversations(const TableLayout& layout, juce::Random& rng)
{
    const auto groups = makeSpeakerGroups(layout.tableSizes);
    if (groups.empty())
    {
        PL_WARN("makeParallelConversations: no tables, scene is a pause");
        return StructureNode::pause(static_cast<double>(layout.duration));
    }

    std::vector<SpeakerId> everyone;
    std::vector<StructureNode> tables;
    for (const auto& group : groups)
    {
        everyone.insert(everyone.end(), group.begin(), group.end());
        tables.push_back(makeTable(group, layout, rng));
    }

    PL_INFO("makeParallelConversations: %d tables, %d speakers, %ds",
            static_cast<int>(groups.size()), static_cast<int>(everyone.size()), layout.duration);

    std::vector<StructureNode> elements;
    elements.push_back(StructureNode::splitter(std::move(tables)));
    return StructureNode::sequence(std::move(elements), std::move(everyone));
}

} // namespace parley
