#include "core/SceneRenderer.h"
#include "core/Logger.h"
#include "core/NoiseGenerator.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <utility>

namespace parley {

namespace {

class ChannelRenderJob final : public juce::ThreadPoolJob {
public:
    ChannelRenderJob(juce::String name, std::function<void()> task)
        : juce::ThreadPoolJob(std::move(name))
        , task_(std::move(task))
    {
    }

    JobStatus runJob() override
    {
        if (task_)
            task_();
        return jobHasFinished;
    }

private:
    std::function<void()> task_;
};

} // namespace

SceneRenderer::SceneRenderer(ClipReader& reader, int threads)
    : reader_(reader)
    , threads_(std::max(1, threads))
{
}

juce::int64 SceneRenderer::timeToSample(double seconds, double sampleRate)
{
    return static_cast<juce::int64>(std::floor(seconds * sampleRate + 0.5));
}

juce::int64 SceneRenderer::totalSamples(const std::vector<SceneSegment>& segments,
                                        double sampleRate)
{
    double maxEnd = 0.0;
    for (const auto& seg : segments)
        maxEnd = std::max(maxEnd, seg.end);
    return static_cast<juce::int64>(std::ceil(maxEnd * sampleRate));
}

// ═══════════════════════════════════════════════════════════════════
// Render
// ═══════════════════════════════════════════════════════════════════

bool SceneRenderer::render(const std::vector<SceneSegment>& segments, int channelCount,
                           double sampleRate, juce::AudioBuffer<float>& out, SceneError& error)
{
    out.setSize(0, 0);

    if (channelCount < 1 || !(sampleRate > 0.0))
    {
        error.set(ErrorKind::renderTarget, "invalid render target: "
                  + std::to_string(channelCount) + " channels at "
                  + juce::String(sampleRate, 1).toStdString() + " Hz");
        PL_WARN("SceneRenderer::render: %s", error.describe().c_str());
        return false;
    }

    const auto length = totalSamples(segments, sampleRate);
    if (!validate(segments, channelCount, sampleRate, length, error))
        return false;

    PL_INFO("SceneRenderer::render: %d segments -> %d ch x %lld samples at %.1f Hz (%d threads)",
            static_cast<int>(segments.size()), channelCount, static_cast<long long>(length),
            sampleRate, threads_);

    juce::AudioBuffer<float> buffer(channelCount, static_cast<int>(length));
    buffer.clear();
    float* const* channels = buffer.getArrayOfWritePointers();

    if (threads_ > 1 && !segments.empty())
    {
        if (!renderThreaded(segments, channelCount, sampleRate, channels, error))
            return false;
    }
    else
    {
        for (size_t i = 0; i < segments.size(); ++i)
        {
            const auto& seg = segments[i];
            if (!renderSegment(seg, static_cast<int>(i), sampleRate, channels[seg.channel], error))
                return false;
        }
    }

    out = std::move(buffer);
    return true;
}

bool SceneRenderer::validate(const std::vector<SceneSegment>& segments, int channelCount,
                             double sampleRate, juce::int64 length, SceneError& error) const
{
    if (length > std::numeric_limits<int>::max())
    {
        error.set(ErrorKind::renderTarget, "scene of " + std::to_string(length)
                  + " samples exceeds the buffer limit");
        PL_WARN("SceneRenderer::validate: %s", error.describe().c_str());
        return false;
    }

    for (size_t i = 0; i < segments.size(); ++i)
    {
        const auto& seg = segments[i];
        const int index = static_cast<int>(i);

        if (seg.channel < 0 || seg.channel >= channelCount)
        {
            error.set(ErrorKind::renderTarget, "channel " + std::to_string(seg.channel)
                      + " outside [0, " + std::to_string(channelCount) + ")", "", index);
            PL_WARN("SceneRenderer::validate: %s", error.describe().c_str());
            return false;
        }

        if (!std::isfinite(seg.start) || !std::isfinite(seg.end) || seg.end <= seg.start)
        {
            error.set(ErrorKind::renderTarget, "invalid span", "", index);
            PL_WARN("SceneRenderer::validate: %s", error.describe().c_str());
            return false;
        }

        const auto first = timeToSample(seg.start, sampleRate);
        const auto last = timeToSample(seg.end, sampleRate);
        if (first < 0 || last > length)
        {
            error.set(ErrorKind::renderTarget, "sample range [" + std::to_string(first) + ", "
                      + std::to_string(last) + ") outside buffer of "
                      + std::to_string(length) + " samples", "", index);
            PL_WARN("SceneRenderer::validate: %s", error.describe().c_str());
            return false;
        }
    }

    return true;
}

bool SceneRenderer::renderSegment(const SceneSegment& seg, int index, double sampleRate,
                                  float* channelData, SceneError& error)
{
    const auto first = timeToSample(seg.start, sampleRate);
    const auto numSamples = static_cast<int>(timeToSample(seg.end, sampleRate) - first);
    if (numSamples <= 0)
        return true;

    float* dest = channelData + first;

    if (auto* file = std::get_if<FileRef>(&seg.payload))
    {
        const auto offset = timeToSample(file->clipOffset, sampleRate);
        if (!reader_.read(file->path, offset, numSamples, sampleRate, dest, error))
        {
            error.segmentIndex = index;
            return false;
        }
    }
    else
    {
        const auto& gen = std::get<GeneratorRef>(seg.payload);
        if (gen.params.kind != NoiseKind::babble)
        {
            NoiseGenerator::fill(gen.params, gen.seed, dest, numSamples);
        }
        else if (!mixBabble(gen, sampleRate, dest, numSamples, error))
        {
            error.segmentIndex = index;
            return false;
        }
    }

    PL_TRACE("SceneRenderer: segment %d ch=%d [%lld, +%d)", index, seg.channel,
             static_cast<long long>(first), numSamples);
    return true;
}

// Clips are summed at equal RMS, then the mix is scaled to peak at the
// babble level. Sample counts round down so a clip is never overrun.
bool SceneRenderer::mixBabble(const GeneratorRef& gen, double sampleRate, float* dest,
                              int numSamples, SceneError& error)
{
    juce::FloatVectorOperations::clear(dest, numSamples);

    std::vector<float> scratch;
    for (const auto& clip : gen.clips)
    {
        const auto pos = timeToSample(clip.at, sampleRate);
        if (pos < 0 || pos >= numSamples)
            continue;
        const auto count = std::min<juce::int64>(
            static_cast<juce::int64>(std::floor(clip.length * sampleRate)), numSamples - pos);
        if (count <= 0)
            continue;

        scratch.resize(static_cast<size_t>(count));
        const auto start = static_cast<juce::int64>(std::floor(clip.clipOffset * sampleRate));
        if (!reader_.read(clip.path, start, static_cast<int>(count), sampleRate,
                          scratch.data(), error))
            return false;

        double energy = 0.0;
        for (float s : scratch)
            energy += static_cast<double>(s) * s;
        const double rms = std::sqrt(energy / static_cast<double>(count));
        if (rms <= 0.0)
            continue;

        juce::FloatVectorOperations::addWithMultiply(dest + pos, scratch.data(),
                                                     static_cast<float>(1.0 / rms),
                                                     static_cast<int>(count));
    }

    const auto range = juce::FloatVectorOperations::findMinAndMax(dest, numSamples);
    const float peak = std::max(std::abs(range.getStart()), std::abs(range.getEnd()));
    if (peak > 0.0f)
        juce::FloatVectorOperations::multiply(dest, gen.params.level / peak, numSamples);

    PL_TRACE("SceneRenderer: babble of %d clips, %d talkers", static_cast<int>(gen.clips.size()),
             gen.params.talkers);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Threaded render
// ═══════════════════════════════════════════════════════════════════

bool SceneRenderer::renderThreaded(const std::vector<SceneSegment>& segments, int channelCount,
                                   double sampleRate, float* const* channels, SceneError& error)
{
    // One job per channel: a job only writes its own channel, so the
    // buffer needs no lock
    std::vector<std::vector<int>> byChannel(static_cast<size_t>(channelCount));
    for (size_t i = 0; i < segments.size(); ++i)
        byChannel[static_cast<size_t>(segments[i].channel)].push_back(static_cast<int>(i));

    std::vector<SceneError> results(static_cast<size_t>(channelCount));
    std::vector<std::unique_ptr<ChannelRenderJob>> jobs;

    juce::ThreadPool pool(threads_);
    for (int ch = 0; ch < channelCount; ++ch)
    {
        const auto& indices = byChannel[static_cast<size_t>(ch)];
        if (indices.empty())
            continue;

        auto& result = results[static_cast<size_t>(ch)];
        float* data = channels[ch];
        jobs.push_back(std::make_unique<ChannelRenderJob>(
            "render ch " + juce::String(ch),
            [this, &segments, &indices, &result, data, sampleRate]() {
                for (int index : indices)
                {
                    if (!renderSegment(segments[static_cast<size_t>(index)], index,
                                       sampleRate, data, result))
                        return;
                }
            }));
        pool.addJob(jobs.back().get(), false);
    }

    for (auto& job : jobs)
        pool.waitForJobToFinish(job.get(), -1);

    const SceneError* failed = nullptr;
    for (const auto& result : results)
    {
        if (!result.ok() && (failed == nullptr || result.segmentIndex < failed->segmentIndex))
            failed = &result;
    }

    if (failed != nullptr)
    {
        error = *failed;
        PL_WARN("SceneRenderer::renderThreaded: %s", error.describe().c_str());
        return false;
    }
    return true;
}

} // namespace parley
