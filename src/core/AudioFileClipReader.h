#pragma once

#include "core/ClipReader.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <string>

namespace parley {

/// ClipReader over audio files on disk, relative paths resolved against
/// an audio root. Opens one juce::AudioFormatReader per call and reads
/// the first channel.
class AudioFileClipReader : public ClipReader {
public:
    explicit AudioFileClipReader(const std::string& audioRoot = "");
    ~AudioFileClipReader() override;

    AudioFileClipReader(const AudioFileClipReader&) = delete;
    AudioFileClipReader& operator=(const AudioFileClipReader&) = delete;

    bool read(const std::string& path, juce::int64 startSample, int numSamples,
              double sampleRate, float* dest, SceneError& error) override;

    juce::File resolve(const std::string& path) const;

private:
    juce::File root_;
    juce::AudioFormatManager formatManager_;
};

} // namespace parley
