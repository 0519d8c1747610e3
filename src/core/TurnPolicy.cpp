#include "core/TurnPolicy.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace parley {

const char* turnOrderName(TurnOrder order)
{
    switch (order)
    {
        case TurnOrder::random:     return "random";
        case TurnOrder::roundRobin: return "roundRobin";
    }
    return "???";
}

bool parseTurnOrder(const std::string& name, TurnOrder& order)
{
    if (name == "random")     { order = TurnOrder::random;     return true; }
    if (name == "roundRobin") { order = TurnOrder::roundRobin; return true; }
    return false;
}

// Box-Muller on juce::Random; 1 - u keeps the log argument in (0, 1]
static double nextGaussian(juce::Random& rng)
{
    const double u1 = 1.0 - rng.nextDouble();
    const double u2 = rng.nextDouble();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(juce::MathConstants<double>::twoPi * u2);
}

// ═══════════════════════════════════════════════════════════════════
// SettingsTurnPolicy
// ═══════════════════════════════════════════════════════════════════

SettingsTurnPolicy::SettingsTurnPolicy(const TurnSettings& settings)
    : settings_(settings)
{
}

double SettingsTurnPolicy::turnLength(SpeakerId, juce::Random& rng)
{
    return settings_.minTurn + (settings_.maxTurn - settings_.minTurn) * rng.nextDouble();
}

double SettingsTurnPolicy::gapAfter(SpeakerId, juce::Random& rng)
{
    if (settings_.gapStdDev <= 0.0)
        return 0.0;

    const double gap = nextGaussian(rng) * settings_.gapStdDev;
    return std::clamp(gap, -settings_.maxOverlap, settings_.maxGap);
}

double SettingsTurnPolicy::minimumTurnLength() const { return settings_.minTurn; }
double SettingsTurnPolicy::maximumOverlap() const { return settings_.maxOverlap; }
const TurnSettings& SettingsTurnPolicy::getSettings() const { return settings_; }

// ═══════════════════════════════════════════════════════════════════
// Speaker order
// ═══════════════════════════════════════════════════════════════════

SpeakerId RandomTurnPolicy::nextSpeaker(const std::vector<SpeakerId>& speakers,
                                        SpeakerId previous, juce::Random& rng)
{
    if (speakers.empty())
        return 0;

    std::vector<SpeakerId> candidates;
    candidates.reserve(speakers.size());
    for (auto s : speakers)
    {
        if (s != previous)
            candidates.push_back(s);
    }
    if (candidates.empty())
        return speakers.front();

    return candidates[static_cast<size_t>(rng.nextInt(static_cast<int>(candidates.size())))];
}

SpeakerId RoundRobinTurnPolicy::nextSpeaker(const std::vector<SpeakerId>& speakers,
                                            SpeakerId previous, juce::Random&)
{
    if (speakers.empty())
        return 0;

    auto it = std::find(speakers.begin(), speakers.end(), previous);
    if (it == speakers.end())
        return speakers.front();

    ++it;
    return it == speakers.end() ? speakers.front() : *it;
}

std::unique_ptr<TurnPolicy> makeTurnPolicy(const TurnSettings& settings)
{
    PL_DEBUG("makeTurnPolicy: order=%s turn=[%.3f, %.3f] gapStdDev=%.3f overlap<=%.3f gap<=%.3f",
             turnOrderName(settings.order), settings.minTurn, settings.maxTurn,
             settings.gapStdDev, settings.maxOverlap, settings.maxGap);

    switch (settings.order)
    {
        case TurnOrder::roundRobin:
            return std::make_unique<RoundRobinTurnPolicy>(settings);
        case TurnOrder::random:
            break;
    }
    return std::make_unique<RandomTurnPolicy>(settings);
}

} // namespace parley
