#pragma once

#include "core/Types.h"

#include <juce_core/juce_core.h>

#include <memory>
#include <string>
#include <vector>

namespace parley {

enum class TurnOrder { random, roundRobin };

const char* turnOrderName(TurnOrder order);
bool parseTurnOrder(const std::string& name, TurnOrder& order);

/// Knobs shared by the built-in policies. All times in seconds.
struct TurnSettings {
    TurnOrder order = TurnOrder::random;
    double minTurn = 2.0;
    double maxTurn = 8.0;
    double gapStdDev = 0.25;    // normal spread of the pause between turns
    double maxOverlap = 0.5;    // gaps are clamped to >= -maxOverlap
    double maxGap = 1.0;        // gaps are clamped to <= maxGap
};

/// Scheduling discipline for conversation turns.
/// Every random draw goes through the supplied generator.
class TurnPolicy {
public:
    virtual ~TurnPolicy() = default;

    /// Choose who speaks next. `previous` is 0 when nobody has spoken.
    virtual SpeakerId nextSpeaker(const std::vector<SpeakerId>& speakers,
                                  SpeakerId previous, juce::Random& rng) = 0;

    /// Requested length of the speaker's next turn (>= minimumTurnLength()).
    virtual double turnLength(SpeakerId speaker, juce::Random& rng) = 0;

    /// Time between the end of the speaker's turn and the next turn start.
    /// Negative values are overlap, bounded by maximumOverlap().
    virtual double gapAfter(SpeakerId speaker, juce::Random& rng) = 0;

    virtual double minimumTurnLength() const = 0;
    virtual double maximumOverlap() const = 0;
};

/// Turn lengths uniform in [minTurn, maxTurn], gaps normal with gapStdDev
/// clamped to [-maxOverlap, maxGap]. Subclasses pick the speaker order.
class SettingsTurnPolicy : public TurnPolicy {
public:
    explicit SettingsTurnPolicy(const TurnSettings& settings);

    double turnLength(SpeakerId speaker, juce::Random& rng) override;
    double gapAfter(SpeakerId speaker, juce::Random& rng) override;
    double minimumTurnLength() const override;
    double maximumOverlap() const override;

    const TurnSettings& getSettings() const;

protected:
    TurnSettings settings_;
};

/// Uniform choice among the speakers other than the previous one.
class RandomTurnPolicy : public SettingsTurnPolicy {
public:
    using SettingsTurnPolicy::SettingsTurnPolicy;

    SpeakerId nextSpeaker(const std::vector<SpeakerId>& speakers,
                          SpeakerId previous, juce::Random& rng) override;
};

/// Speakers in listed order, continuing after the previous speaker.
class RoundRobinTurnPolicy : public SettingsTurnPolicy {
public:
    using SettingsTurnPolicy::SettingsTurnPolicy;

    SpeakerId nextSpeaker(const std::vector<SpeakerId>& speakers,
                          SpeakerId previous, juce::Random& rng) override;
};

std::unique_ptr<TurnPolicy> makeTurnPolicy(const TurnSettings& settings);

} // namespace parley
