#include "ResampledSource.h"

#include <algorithm>
#include <cmath>
#include <utility>

ResampledSource::ResampledSource(PcmBufferPtr buffer, std::size_t startIndex, int outputSampleRate, double speed)
    : m_buffer(std::move(buffer))
    , m_speed(speed > 0.0 && std::isfinite(speed) ? speed : 1.0) {
    if (!m_buffer || m_buffer->channels <= 0)
        return;

    m_channels = m_buffer->channels;
    m_totalFrames = m_buffer->totalFrames();
    m_outputSampleRate = outputSampleRate > 0 ? outputSampleRate : m_buffer->sampleRate;

    const double rateRatio = m_buffer->sampleRate > 0
        ? static_cast<double>(m_buffer->sampleRate) / static_cast<double>(m_outputSampleRate)
        : 1.0;
    m_step = m_speed * rateRatio;

    const std::size_t startFrame = std::min(startIndex, m_buffer->totalSamples()) / static_cast<std::size_t>(m_channels);
    m_cursor = static_cast<double>(startFrame);
}

bool ResampledSource::exhausted() const {
    return m_cursor >= static_cast<double>(m_totalFrames);
}

void ResampledSource::frameAt(double position, float* out) const {
    const std::size_t lastFrame = m_totalFrames - 1;
    const std::size_t i0 = std::min(static_cast<std::size_t>(position), lastFrame);
    const std::size_t i1 = std::min(i0 + 1, lastFrame);
    const float frac = static_cast<float>(position - static_cast<double>(i0));

    const float* samples = m_buffer->samples.data();
    const std::size_t channels = static_cast<std::size_t>(m_channels);
    for (std::size_t c = 0; c < channels; ++c) {
        const float a = samples[i0 * channels + c];
        const float b = samples[i1 * channels + c];
        out[c] = a + (b - a) * frac;
    }
}

int ResampledSource::read(float* dst, int frames, int outChannels) {
    if (!dst || frames <= 0 || outChannels <= 0 || m_channels <= 0)
        return 0;

    float frame[2] {0.f, 0.f};
    int produced = 0;
    while (produced < frames && !exhausted()) {
        frameAt(m_cursor, frame);
        float* target = dst + static_cast<std::size_t>(produced) * static_cast<std::size_t>(outChannels);
        if (m_channels == 1) {
            std::fill(target, target + outChannels, frame[0]);
        } else if (outChannels == 1) {
            target[0] = 0.5f * (frame[0] + frame[1]);
        } else {
            target[0] = frame[0];
            target[1] = frame[1];
            std::fill(target + 2, target + outChannels, 0.f);
        }
        m_cursor += m_step;
        ++produced;
    }
    return produced;
}
