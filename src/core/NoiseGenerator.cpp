#include "core/NoiseGenerator.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <cmath>

namespace parley {

static void fillWhite(juce::Random& rng, float level, float* dest, int numSamples)
{
    for (int i = 0; i < numSamples; ++i)
        dest[i] = level * (2.0f * rng.nextFloat() - 1.0f);
}

static void fillPink(juce::Random& rng, float level, float* dest, int numSamples)
{
    float b0 = 0.0f, b1 = 0.0f, b2 = 0.0f;
    float peak = 0.0f;

    for (int i = 0; i < numSamples; ++i)
    {
        const float white = 2.0f * rng.nextFloat() - 1.0f;
        b0 = 0.99765f * b0 + white * 0.0990460f;
        b1 = 0.96300f * b1 + white * 0.2965164f;
        b2 = 0.57000f * b2 + white * 1.0526913f;
        const float pink = b0 + b1 + b2 + white * 0.1848f;
        dest[i] = pink;
        peak = std::max(peak, std::abs(pink));
    }

    if (peak <= 0.0f)
        return;

    const float gain = level / peak;
    for (int i = 0; i < numSamples; ++i)
        dest[i] *= gain;
}

void NoiseGenerator::fill(const NoiseParams& params, int seed, float* dest, int numSamples)
{
    if (dest == nullptr || numSamples <= 0)
        return;

    juce::Random rng(static_cast<juce::int64>(seed));
    switch (params.kind)
    {
        case NoiseKind::white: fillWhite(rng, params.level, dest, numSamples); break;
        case NoiseKind::pink:  fillPink(rng, params.level, dest, numSamples);  break;
        case NoiseKind::babble: std::fill(dest, dest + numSamples, 0.0f); break;
    }

    PL_TRACE("NoiseGenerator::fill: kind=%s level=%.3f seed=%d n=%d",
             noiseKindName(params.kind), static_cast<double>(params.level), seed, numSamples);
}

} // namespace parley
