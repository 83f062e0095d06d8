#pragma once

#include <cstddef>
#include <memory>
#include <vector>

// Fully decoded recording. Samples are interleaved (L,R,L,R... for stereo).
struct PcmBuffer {
    std::vector<float> samples;
    int sampleRate {0};
    int channels {0};

    [[nodiscard]] std::size_t totalSamples() const noexcept { return samples.size(); }

    [[nodiscard]] std::size_t totalFrames() const noexcept {
        return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
    }

    [[nodiscard]] double durationSec() const noexcept {
        if (sampleRate <= 0)
            return 0.0;
        return static_cast<double>(totalFrames()) / static_cast<double>(sampleRate);
    }
};

using PcmBufferPtr = std::shared_ptr<const PcmBuffer>;
