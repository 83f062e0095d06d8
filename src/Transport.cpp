#include "Transport.h"

#include "audio/AudioOutput.h"
#include "audio/ResampledSource.h"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <utility>

Transport::Transport(AudioOutput& output, ClockFn clock)
    : m_output(output)
    , m_clock(clock ? std::move(clock) : ClockFn([]() { return Clock::now(); })) {}

Transport::~Transport() {
    releaseSink();
}

double Transport::clampSpeed(double factor) {
    if (std::isnan(factor))
        return 1.0;
    return std::clamp(factor, kMinSpeed, kMaxSpeed);
}

void Transport::load(PcmBufferPtr buffer) {
    stop();
    m_buffer = std::move(buffer);
    m_restingIndex = 0;
    m_startIndex = 0;
    m_speed = 1.0;
    m_lastError.clear();
    if (m_buffer) {
        qInfo() << "Transport" << "load"
                << "samples" << static_cast<qulonglong>(m_buffer->totalSamples())
                << "sr" << m_buffer->sampleRate << "ch" << m_buffer->channels;
    }
}

void Transport::unload() {
    stop();
    m_buffer.reset();
    m_restingIndex = 0;
    m_startIndex = 0;
}

std::size_t Transport::clampIndex(long long index) const {
    if (index <= 0 || !m_buffer)
        return 0;
    return std::min(static_cast<std::size_t>(index), m_buffer->totalSamples());
}

std::size_t Transport::currentIndex() const {
    if (!m_running || !m_buffer)
        return m_restingIndex;

    const double elapsed = std::max(0.0, std::chrono::duration<double>(m_clock() - m_startTime).count());
    const double delta = std::floor(elapsed
                                    * static_cast<double>(m_buffer->sampleRate)
                                    * m_speed
                                    * static_cast<double>(m_buffer->channels));
    const std::size_t total = m_buffer->totalSamples();
    if (delta >= static_cast<double>(total - std::min(m_startIndex, total)))
        return total;
    return m_startIndex + static_cast<std::size_t>(delta);
}

PositionSnapshot Transport::positionSnapshot() const {
    PositionSnapshot snapshot;
    if (!m_buffer || m_buffer->channels <= 0)
        return snapshot;
    const auto channels = static_cast<std::size_t>(m_buffer->channels);
    snapshot.currentFrames = currentIndex() / channels;
    snapshot.totalFrames = m_buffer->totalFrames();
    return snapshot;
}

void Transport::releaseSink() {
    if (m_sink) {
        m_sink->stop();
        m_sink.reset();
    }
}

PlaybackError Transport::bindAt(std::size_t index) {
    // The old producer is gone before the new one is created.
    releaseSink();

    QString error;
    std::unique_ptr<PlaybackSink> sink = m_output.createSink(m_buffer->channels, m_buffer->sampleRate, &error);
    if (!sink) {
        m_running = false;
        m_lastError = error.isEmpty() ? QStringLiteral("Audio output unavailable") : error;
        qWarning() << "Transport" << "sink-create-failed" << m_lastError;
        return PlaybackError::SinkUnavailable;
    }

    sink->append(std::make_unique<ResampledSource>(m_buffer, index, sink->outputSampleRate(), m_speed));
    sink->play();

    m_sink = std::move(sink);
    m_restingIndex = index;
    m_startIndex = index;
    m_startTime = m_clock();
    m_running = true;
    m_lastError.clear();
    return PlaybackError::None;
}

PlaybackError Transport::playFrom(std::size_t index) {
    if (!m_buffer) {
        m_lastError = QStringLiteral("No file loaded");
        return PlaybackError::NotLoaded;
    }

    const std::size_t previous = currentIndex();
    const std::size_t target = std::min(index, m_buffer->totalSamples());
    const PlaybackError result = bindAt(target);
    if (result != PlaybackError::None) {
        m_restingIndex = previous;
        return result;
    }

    qInfo() << "Transport" << "play" << static_cast<qulonglong>(target) << "speed" << m_speed;
    return PlaybackError::None;
}

PlaybackError Transport::resume() {
    if (m_running)
        return PlaybackError::None;
    return playFrom(m_restingIndex);
}

void Transport::pause() {
    if (!m_running)
        return;
    m_restingIndex = currentIndex();
    releaseSink();
    m_running = false;
    qInfo() << "Transport" << "pause" << static_cast<qulonglong>(m_restingIndex);
}

void Transport::stop() {
    releaseSink();
    m_running = false;
}

PlaybackError Transport::seekSeconds(double deltaSeconds) {
    if (!m_buffer) {
        m_lastError = QStringLiteral("No file loaded");
        return PlaybackError::NotLoaded;
    }
    if (!std::isfinite(deltaSeconds))
        return PlaybackError::None;

    const double deltaSamples = std::floor(deltaSeconds
                                           * static_cast<double>(m_buffer->sampleRate)
                                           * static_cast<double>(m_buffer->channels));
    const auto base = static_cast<long long>(currentIndex());
    const std::size_t target = clampIndex(base + static_cast<long long>(deltaSamples));
    m_restingIndex = target;

    if (!m_running)
        return PlaybackError::None;

    const PlaybackError result = bindAt(target);
    if (result == PlaybackError::None)
        qInfo() << "Transport" << "seek" << deltaSeconds << "->" << static_cast<qulonglong>(target);
    return result;
}

PlaybackError Transport::setSpeed(double factor) {
    const double clamped = clampSpeed(factor);
    if (!m_running) {
        m_speed = clamped;
        return PlaybackError::None;
    }

    // Commit the position reached under the old speed before switching.
    const std::size_t index = currentIndex();
    m_restingIndex = index;
    m_speed = clamped;
    qInfo() << "Transport" << "speed" << m_speed;
    return bindAt(index);
}

bool Transport::clampAtEnd() {
    if (!m_running || !m_buffer)
        return false;
    if (currentIndex() < m_buffer->totalSamples())
        return false;

    pause();
    m_restingIndex = m_buffer->totalSamples();
    qInfo() << "Transport" << "end-of-stream";
    return true;
}
