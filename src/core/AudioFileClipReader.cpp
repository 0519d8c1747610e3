#include "core/AudioFileClipReader.h"
#include "core/Logger.h"

#include <cmath>
#include <memory>

namespace parley {

AudioFileClipReader::AudioFileClipReader(const std::string& audioRoot)
    : root_(audioRoot.empty()
                ? juce::File::getCurrentWorkingDirectory()
                : juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(audioRoot)))
{
    formatManager_.registerBasicFormats();
    PL_INFO("AudioFileClipReader: root=%s, %d audio formats",
            root_.getFullPathName().toRawUTF8(), formatManager_.getNumKnownFormats());
}

AudioFileClipReader::~AudioFileClipReader()
{
    PL_DEBUG("AudioFileClipReader: destroying");
}

juce::File AudioFileClipReader::resolve(const std::string& path) const
{
    return root_.getChildFile(juce::String(path));
}

bool AudioFileClipReader::read(const std::string& path, juce::int64 startSample, int numSamples,
                               double sampleRate, float* dest, SceneError& error)
{
    auto file = resolve(path);
    if (!file.existsAsFile())
    {
        error.set(ErrorKind::io, "File not found: " + file.getFullPathName().toStdString());
        PL_WARN("AudioFileClipReader::read: %s", error.message.c_str());
        return false;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(file));
    if (!reader)
    {
        error.set(ErrorKind::io, "Unsupported or corrupted audio file: " + path);
        PL_WARN("AudioFileClipReader::read: %s", error.message.c_str());
        return false;
    }

    if (std::abs(reader->sampleRate - sampleRate) > 0.5)
    {
        error.set(ErrorKind::io, "Sample rate mismatch in " + path + ": file "
                  + std::to_string(static_cast<int>(reader->sampleRate)) + " Hz, render "
                  + std::to_string(static_cast<int>(sampleRate)) + " Hz");
        PL_WARN("AudioFileClipReader::read: %s", error.message.c_str());
        return false;
    }

    if (startSample < 0 || startSample + numSamples > reader->lengthInSamples)
    {
        error.set(ErrorKind::insufficientSourceMaterial,
                  "Clip " + path + " holds " + std::to_string(reader->lengthInSamples)
                  + " samples, need " + std::to_string(startSample + numSamples));
        PL_WARN("AudioFileClipReader::read: %s", error.message.c_str());
        return false;
    }

    if (numSamples <= 0)
        return true;

    juce::AudioBuffer<float> data(1, numSamples);
    if (!reader->read(&data, 0, numSamples, startSample, true, false))
    {
        error.set(ErrorKind::io, "Failed to read audio data from: " + path);
        PL_WARN("AudioFileClipReader::read: %s", error.message.c_str());
        return false;
    }

    juce::FloatVectorOperations::copy(dest, data.getReadPointer(0), numSamples);
    PL_TRACE("AudioFileClipReader::read: %s [%lld, +%d)", path.c_str(),
             static_cast<long long>(startSample), numSamples);
    return true;
}

} // namespace parley
