#include "core/ClipPool.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace parley {

ClipPool::ClipPool(const ClipSettings& settings)
    : settings_(settings)
{
    PL_DEBUG("ClipPool: created (allowReuse=%d, randomOffset=%d)",
             settings_.allowReuse ? 1 : 0, settings_.randomOffset ? 1 : 0);
}

ClipPool::~ClipPool()
{
    PL_DEBUG("ClipPool: destroying with %d clips", getTotalClips());
}

// ═══════════════════════════════════════════════════════════════════
// Population
// ═══════════════════════════════════════════════════════════════════

bool ClipPool::addClip(const ClipInfo& clip, std::string& error)
{
    if (clip.speaker < 1 || clip.path.empty() || !(clip.duration > 0.0))
    {
        error = "Invalid clip (speaker=" + std::to_string(clip.speaker)
                + ", path='" + clip.path + "', duration=" + std::to_string(clip.duration) + ")";
        PL_WARN("ClipPool::addClip: %s", error.c_str());
        return false;
    }

    auto& entry = speakers_[clip.speaker];
    entry.clips.push_back(clip);
    entry.used.push_back(false);
    PL_TRACE("ClipPool::addClip: speaker=%d path=%s dur=%.3f",
             clip.speaker, clip.path.c_str(), clip.duration);
    return true;
}

bool ClipPool::loadIndex(const std::string& csvText, double sampleRate,
                         const std::vector<int>& selected, std::string& error)
{
    if (sampleRate <= 0.0)
    {
        error = "Invalid sample rate for clip index";
        PL_WARN("ClipPool::loadIndex: %s", error.c_str());
        return false;
    }

    juce::StringArray lines;
    lines.addLines(juce::String(csvText));
    lines.removeEmptyStrings(true);
    if (lines.isEmpty())
    {
        error = "Empty clip index";
        PL_WARN("ClipPool::loadIndex: %s", error.c_str());
        return false;
    }

    auto header = juce::StringArray::fromTokens(lines[0], ",", "\"");
    header.trim();
    const int speakerCol = header.indexOf("speaker");
    const int fileCol = header.indexOf("file_name");
    const int lengthCol = header.indexOf("length");
    if (speakerCol < 0 || fileCol < 0 || lengthCol < 0)
    {
        error = "Clip index header must name speaker, file_name and length";
        PL_WARN("ClipPool::loadIndex: %s", error.c_str());
        return false;
    }

    std::map<SpeakerId, std::vector<ClipInfo>> loaded;
    for (int row = 1; row < lines.size(); ++row)
    {
        auto fields = juce::StringArray::fromTokens(lines[row], ",", "\"");
        fields.trim();
        if (fields.size() < header.size())
        {
            error = "Clip index row " + std::to_string(row) + " has too few fields";
            PL_WARN("ClipPool::loadIndex: %s", error.c_str());
            return false;
        }

        const auto speakerText = fields[speakerCol].unquoted();
        const auto fileName = fields[fileCol].unquoted();
        const double lengthSamples = fields[lengthCol].unquoted().getDoubleValue();
        if (!speakerText.containsOnly("0123456789") || speakerText.isEmpty()
            || fileName.isEmpty() || lengthSamples <= 0.0)
        {
            error = "Clip index row " + std::to_string(row) + " is malformed";
            PL_WARN("ClipPool::loadIndex: %s", error.c_str());
            return false;
        }

        SpeakerId speaker = speakerText.getIntValue();
        if (!selected.empty())
        {
            auto it = std::find(selected.begin(), selected.end(), speaker);
            if (it == selected.end())
                continue;
            speaker = static_cast<SpeakerId>(std::distance(selected.begin(), it)) + 1;
        }
        if (speaker < 1)
        {
            error = "Clip index row " + std::to_string(row) + " has speaker id 0";
            PL_WARN("ClipPool::loadIndex: %s", error.c_str());
            return false;
        }

        loaded[speaker].push_back({speaker, fileName.toStdString(), lengthSamples / sampleRate});
    }

    if (loaded.empty())
    {
        error = "Clip index holds no clips for the selected speakers";
        PL_WARN("ClipPool::loadIndex: %s", error.c_str());
        return false;
    }

    int count = 0;
    for (auto& [speaker, clips] : loaded)
    {
        std::stable_sort(clips.begin(), clips.end(),
                         [](const ClipInfo& a, const ClipInfo& b) { return a.path < b.path; });
        auto& entry = speakers_[speaker];
        for (const auto& clip : clips)
        {
            entry.clips.push_back(clip);
            entry.used.push_back(false);
            ++count;
        }
    }

    sampleRate_ = sampleRate;
    PL_INFO("ClipPool::loadIndex: %d clips for %d speakers", count,
            static_cast<int>(loaded.size()));
    return true;
}

bool ClipPool::loadIndexFile(const std::string& path, double sampleRate,
                             const std::vector<int>& selected, std::string& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile())
    {
        error = "File not found: " + path;
        PL_WARN("ClipPool::loadIndexFile: %s", error.c_str());
        return false;
    }

    return loadIndex(file.loadFileAsString().toStdString(), sampleRate, selected, error);
}

// ═══════════════════════════════════════════════════════════════════
// Selection
// ═══════════════════════════════════════════════════════════════════

bool ClipPool::nextClip(SpeakerId speaker, double minLength, juce::Random& rng,
                        ClipChoice& out, std::string& error)
{
    auto it = speakers_.find(speaker);
    if (it == speakers_.end() || it->second.clips.empty())
    {
        error = "No clips for speaker " + std::to_string(speaker);
        PL_WARN("ClipPool::nextClip: %s", error.c_str());
        return false;
    }

    auto& entry = it->second;
    const size_t n = entry.clips.size();
    for (size_t step = 0; step < n; ++step)
    {
        const size_t idx = (entry.cursor + step) % n;
        if (entry.used[idx] && !settings_.allowReuse)
            continue;
        const auto& clip = entry.clips[idx];
        if (clip.duration < minLength)
            continue;

        if (idx < entry.cursor)
            PL_WARN("ClipPool::nextClip: speaker %d out of fresh clips, wrapping", speaker);

        out.path = clip.path;
        out.duration = clip.duration;
        out.offset = 0.0;
        if (settings_.randomOffset)
            out.offset = randomOffset(clip, minLength, rng);

        entry.used[idx] = true;
        entry.cursor = (idx + 1) % n;
        PL_TRACE("ClipPool::nextClip: speaker=%d len>=%.3f -> %s (+%.3f)",
                 speaker, minLength, out.path.c_str(), out.offset);
        return true;
    }

    error = "No clip of at least " + juce::String(minLength, 3).toStdString()
            + "s available for speaker " + std::to_string(speaker);
    PL_WARN("ClipPool::nextClip: %s", error.c_str());
    return false;
}

double ClipPool::randomOffset(const ClipInfo& clip, double minLength, juce::Random& rng) const
{
    if (sampleRate_ <= 0.0)
        return (clip.duration - minLength) * rng.nextDouble();

    // The renderer rounds the segment ends separately, so a segment of
    // minLength seconds may read up to ceil(minLength * sr) + 1 samples
    const auto clipSamples = static_cast<juce::int64>(std::floor(clip.duration * sampleRate_ + 0.5));
    const auto needed = static_cast<juce::int64>(std::ceil(minLength * sampleRate_)) + 1;
    const auto slack = std::min<juce::int64>(clipSamples - needed,
                                             std::numeric_limits<int>::max() - 1);
    if (slack <= 0)
        return 0.0;
    return static_cast<double>(rng.nextInt(static_cast<int>(slack) + 1)) / sampleRate_;
}

void ClipPool::checkpoint()
{
    saved_.clear();
    for (const auto& [speaker, entry] : speakers_)
        saved_[speaker] = {entry.used, entry.cursor};
}

void ClipPool::rollback()
{
    for (auto& [speaker, entry] : speakers_)
    {
        auto it = saved_.find(speaker);
        if (it == saved_.end())
            continue;
        entry.used = it->second.first;
        entry.cursor = it->second.second;
    }
    PL_DEBUG("ClipPool::rollback: restored cursors of %d speakers", static_cast<int>(saved_.size()));
}

void ClipPool::setSampleRate(double sampleRate)
{
    sampleRate_ = sampleRate;
}

double ClipPool::getSampleRate() const
{
    return sampleRate_;
}

void ClipPool::rewind()
{
    for (auto& [speaker, entry] : speakers_)
    {
        entry.cursor = 0;
        std::fill(entry.used.begin(), entry.used.end(), false);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

int ClipPool::getNumClips(SpeakerId speaker) const
{
    auto it = speakers_.find(speaker);
    if (it == speakers_.end())
        return 0;
    return static_cast<int>(it->second.clips.size());
}

int ClipPool::getTotalClips() const
{
    int total = 0;
    for (const auto& [speaker, entry] : speakers_)
        total += static_cast<int>(entry.clips.size());
    return total;
}

std::vector<SpeakerId> ClipPool::getSpeakers() const
{
    std::vector<SpeakerId> result;
    result.reserve(speakers_.size());
    for (const auto& [speaker, entry] : speakers_)
        result.push_back(speaker);
    return result;
}

double ClipPool::getTotalDuration(SpeakerId speaker) const
{
    auto it = speakers_.find(speaker);
    if (it == speakers_.end())
        return 0.0;
    double total = 0.0;
    for (const auto& clip : it->second.clips)
        total += clip.duration;
    return total;
}

const ClipSettings& ClipPool::getSettings() const
{
    return settings_;
}

} // namespace parley
