#pragma once

#include "core/Structure.h"

#include <juce_core/juce_core.h>

#include <vector>

namespace parley {

/// Parameters of the cafe scenario: independent tables talking in
/// parallel, larger tables alternating between one shared conversation
/// and two side conversations.
struct TableLayout {
    std::vector<int> tableSizes;    // speakers per table
    int duration = 0;               // seconds
    bool segment = false;           // alternate whole-table and split conversations
    double halfLife = 600.0;        // scale of the segment length distribution
    int minDuration = 30;           // shortest segment
    double minTurn = 2.0;           // segments always seat every speaker of the table
};

/// Consecutive speaker ids per table: [2, 3] -> [[1, 2], [3, 4, 5]].
std::vector<std::vector<SpeakerId>> makeSpeakerGroups(const std::vector<int>& tableSizes);

/// Whole-second segment lengths drawn from an exponential distribution,
/// floored at minDuration, summing to exactly `duration`. A remainder
/// shorter than the floor is folded into the last segment, so only a
/// duration below the floor yields a segment shorter than it.
std::vector<int> exponentialSegments(double halfLife, int minDuration, int duration,
                                     juce::Random& rng);

/// One table. Fewer than four speakers (or segment off) gives a single
/// conversation; otherwise a sequence alternating the whole table with a
/// splitter of two random sub-groups. Segments are at least
/// max(minDuration, speakers x minTurn) long. A table too small to
/// converse is a pause.
StructureNode makeTable(const std::vector<SpeakerId>& speakers, const TableLayout& layout,
                        juce::Random& rng);

/// sequence(all speakers) [ splitter [ table... ] ]
StructureNode makeParallelConversations(const TableLayout& layout, juce::Random& rng);

} // namespace parley
