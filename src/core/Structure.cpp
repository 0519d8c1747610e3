#include "core/Structure.h"

#include <algorithm>
#include <utility>

namespace parley {

StructureNode StructureNode::sequence(std::vector<StructureNode> elements,
                                      std::vector<SpeakerId> speakers)
{
    StructureNode node;
    node.value = SequenceNode{std::move(speakers), std::move(elements)};
    return node;
}

StructureNode StructureNode::splitter(std::vector<StructureNode> elements,
                                      std::vector<SpeakerId> speakers)
{
    StructureNode node;
    node.value = SplitterNode{std::move(speakers), std::move(elements)};
    return node;
}

StructureNode StructureNode::conversation(std::vector<SpeakerId> speakers, double duration)
{
    StructureNode node;
    node.value = ConversationNode{std::move(speakers), duration};
    return node;
}

StructureNode StructureNode::noise(double duration, NoiseParams params, ChannelId channel,
                                  std::vector<SpeakerId> sources)
{
    StructureNode node;
    node.value = NoiseNode{duration, params, channel, std::move(sources)};
    return node;
}

StructureNode StructureNode::pause(double duration)
{
    StructureNode node;
    node.value = PauseNode{duration};
    return node;
}

const char* nodeTypeName(const StructureNode& node)
{
    return std::visit(Overloaded{
        [](const SequenceNode&)     { return "sequence"; },
        [](const SplitterNode&)     { return "splitter"; },
        [](const ConversationNode&) { return "conversation"; },
        [](const NoiseNode&)        { return "noise"; },
        [](const PauseNode&)        { return "pause"; },
    }, node.value);
}

double declaredDuration(const StructureNode& node)
{
    return std::visit(Overloaded{
        [](const SequenceNode& n) {
            double total = 0.0;
            for (const auto& child : n.elements)
                total += declaredDuration(child);
            return total;
        },
        [](const SplitterNode& n) {
            double longest = 0.0;
            for (const auto& child : n.elements)
                longest = std::max(longest, declaredDuration(child));
            return longest;
        },
        [](const ConversationNode& n) { return n.duration; },
        [](const NoiseNode& n)        { return n.duration; },
        [](const PauseNode& n)        { return n.duration; },
    }, node.value);
}

int countNodes(const StructureNode& node)
{
    int count = 1;
    if (auto* seq = std::get_if<SequenceNode>(&node.value))
    {
        for (const auto& child : seq->elements)
            count += countNodes(child);
    }
    else if (auto* split = std::get_if<SplitterNode>(&node.value))
    {
        for (const auto& child : split->elements)
            count += countNodes(child);
    }
    return count;
}

} // namespace parley
