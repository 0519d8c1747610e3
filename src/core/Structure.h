#pragma once

#include "core/Types.h"

#include <variant>
#include <vector>

namespace parley {

struct StructureNode;

/// Children run one after another on a single timeline.
/// An empty speaker list inherits the enclosing scope.
struct SequenceNode {
    std::vector<SpeakerId> speakers;
    std::vector<StructureNode> elements;
};

/// Children start together on independent timelines; ends with the longest.
struct SplitterNode {
    std::vector<SpeakerId> speakers;
    std::vector<StructureNode> elements;
};

struct ConversationNode {
    std::vector<SpeakerId> speakers;
    double duration = 0.0;
};

struct NoiseNode {
    double duration = 0.0;
    NoiseParams params;
    ChannelId channel = -1;     // -1 = configured noise channel
    std::vector<SpeakerId> sources; // babble: speakers whose clips are mixed
};

struct PauseNode {
    double duration = 0.0;
};

struct StructureNode {
    using Variant = std::variant<SequenceNode, SplitterNode, ConversationNode,
                                 NoiseNode, PauseNode>;
    Variant value;

    // --- Construction helpers ---
    static StructureNode sequence(std::vector<StructureNode> elements,
                                  std::vector<SpeakerId> speakers = {});
    static StructureNode splitter(std::vector<StructureNode> elements,
                                  std::vector<SpeakerId> speakers = {});
    static StructureNode conversation(std::vector<SpeakerId> speakers, double duration);
    static StructureNode noise(double duration, NoiseParams params = {},
                               ChannelId channel = -1, std::vector<SpeakerId> sources = {});
    static StructureNode pause(double duration);
};

/// "sequence", "splitter", "conversation", "noise" or "pause".
const char* nodeTypeName(const StructureNode& node);

/// Time the node consumes: explicit duration, sum of children for a
/// sequence, maximum of children for a splitter.
double declaredDuration(const StructureNode& node);

/// Number of nodes in the subtree, including the node itself.
int countNodes(const StructureNode& node);

// Visitor helper for std::visit over StructureNode::Variant
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace parley
