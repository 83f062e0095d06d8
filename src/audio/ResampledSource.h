#pragma once

#include "AudioOutput.h"
#include "PcmBuffer.h"

#include <cstddef>

// Speed-scaled reader over a shared PCM buffer. The read cursor is a
// fractional frame position advancing by speed * sourceRate / outputRate
// frames per emitted frame; samples between two source frames are linearly
// interpolated. Pitch is unchanged at speed 1.0 and matching rates.
class ResampledSource : public SampleSource {
public:
    ResampledSource(PcmBufferPtr buffer, std::size_t startIndex, int outputSampleRate, double speed);

    int read(float* dst, int frames, int outChannels) override;
    bool exhausted() const override;

    int channels() const noexcept { return m_channels; }
    int outputSampleRate() const noexcept { return m_outputSampleRate; }
    double speed() const noexcept { return m_speed; }
    double step() const noexcept { return m_step; }
    double cursorFrames() const noexcept { return m_cursor; }

private:
    void frameAt(double position, float* out) const;

    PcmBufferPtr m_buffer;
    std::size_t m_totalFrames {0};
    int m_channels {0};
    int m_outputSampleRate {0};
    double m_speed {1.0};
    double m_step {1.0};
    double m_cursor {0.0};
};
