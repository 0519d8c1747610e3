#pragma once

#include "core/ClipSource.h"

#include <map>
#include <utility>
#include <string>
#include <vector>

namespace parley {

struct ClipInfo {
    SpeakerId speaker = 0;
    std::string path;
    double duration = 0.0;  // seconds
};

struct ClipSettings {
    bool allowReuse = true;     // wrap around once a speaker's clips are used up
    bool randomOffset = false;  // start inside the slack of a longer clip
    std::vector<int> speakers;  // dataset ids of scene speakers 1..N; empty = ids as is
};

/// In-memory per-speaker clip lists with a sequential cursor per speaker.
class ClipPool : public ClipSource {
public:
    explicit ClipPool(const ClipSettings& settings = {});
    ~ClipPool() override;

    ClipPool(const ClipPool&) = delete;
    ClipPool& operator=(const ClipPool&) = delete;

    // --- Population ---
    bool addClip(const ClipInfo& clip, std::string& error);

    /// Utterance index CSV with a header naming at least `speaker`,
    /// `file_name` and `length` (length in samples at `sampleRate`).
    /// With `selected` non-empty, dataset speaker selected[k - 1] becomes
    /// scene speaker k and other rows are skipped; otherwise the dataset id
    /// is used as is. Clips of each speaker are ordered by file name.
    /// On failure the pool is unchanged.
    bool loadIndex(const std::string& csvText, double sampleRate,
                   const std::vector<int>& selected, std::string& error);
    bool loadIndexFile(const std::string& path, double sampleRate,
                       const std::vector<int>& selected, std::string& error);

    // --- ClipSource ---
    bool nextClip(SpeakerId speaker, double minLength, juce::Random& rng,
                  ClipChoice& out, std::string& error) override;

    void checkpoint() override;
    void rollback() override;

    /// Forget which clips were handed out; cursors back to the first clip.
    void rewind();

    /// Rate the clips will be read at. When set (loadIndex sets it), random
    /// offsets fall on whole samples and leave room for the renderer's
    /// rounding of the segment ends.
    void setSampleRate(double sampleRate);
    double getSampleRate() const;

    // --- Queries ---
    int getNumClips(SpeakerId speaker) const;
    int getTotalClips() const;
    double getTotalDuration(SpeakerId speaker) const;   // seconds
    std::vector<SpeakerId> getSpeakers() const;
    const ClipSettings& getSettings() const;

private:
    struct SpeakerClips {
        std::vector<ClipInfo> clips;
        std::vector<bool> used;
        size_t cursor = 0;
    };

    double randomOffset(const ClipInfo& clip, double minLength, juce::Random& rng) const;

    ClipSettings settings_;
    double sampleRate_ = 0.0;
    std::map<SpeakerId, SpeakerClips> speakers_;
    std::map<SpeakerId, std::pair<std::vector<bool>, size_t>> saved_;
};

} // namespace parley
