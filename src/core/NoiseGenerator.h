#pragma once

#include "core/Types.h"

namespace parley {

/// Deterministic noise synthesis for generator segments.
/// The samples depend only on (kind, level, seed, numSamples).
class NoiseGenerator {
public:
    /// White: uniform in [-level, level]. Pink: Paul Kellett's economy
    /// filter over white noise, rescaled so the peak equals level.
    /// Babble needs source clips and comes out silent here; SceneRenderer
    /// mixes it.
    static void fill(const NoiseParams& params, int seed, float* dest, int numSamples);
};

} // namespace parley
