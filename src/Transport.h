#pragma once

#include "PlaybackControl.h"
#include "audio/PcmBuffer.h"

#include <QString>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

class AudioOutput;
class PlaybackSink;

struct PositionSnapshot {
    std::size_t currentFrames {0};
    std::size_t totalFrames {0};
};

// Authoritative playback position over one loaded recording. The active
// source runs on the output's delivery thread and never reports back, so
// while running the position is extrapolated from the (index, time) pair
// captured at the last bind. Not thread-safe: owned by the UI thread.
class Transport : public PlaybackControl {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr double kMinSpeed = 0.1;
    static constexpr double kMaxSpeed = 4.0;

    explicit Transport(AudioOutput& output, ClockFn clock = {});
    ~Transport() override;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    void load(PcmBufferPtr buffer);
    void unload();

    PlaybackError playFrom(std::size_t index);
    PlaybackError resume() override;
    void pause() override;
    void stop();
    PlaybackError seekSeconds(double deltaSeconds) override;
    PlaybackError setSpeed(double factor);

    // Pauses and pins the position to the end once the estimate reaches it.
    // Returns true on the tick that performed the transition.
    bool clampAtEnd();

    [[nodiscard]] PositionSnapshot positionSnapshot() const;
    [[nodiscard]] std::size_t currentIndex() const;
    [[nodiscard]] std::size_t restingIndex() const noexcept { return m_restingIndex; }

    bool isPlaying() const override { return m_running; }
    [[nodiscard]] bool isLoaded() const noexcept { return m_buffer != nullptr; }
    [[nodiscard]] double speed() const noexcept { return m_speed; }
    [[nodiscard]] int sampleRate() const noexcept { return m_buffer ? m_buffer->sampleRate : 0; }
    [[nodiscard]] int channels() const noexcept { return m_buffer ? m_buffer->channels : 0; }
    [[nodiscard]] std::size_t totalSamples() const noexcept { return m_buffer ? m_buffer->totalSamples() : 0; }
    [[nodiscard]] const PcmBufferPtr& buffer() const noexcept { return m_buffer; }
    [[nodiscard]] const QString& lastErrorText() const noexcept { return m_lastError; }

    static double clampSpeed(double factor);

private:
    PlaybackError bindAt(std::size_t index);
    void releaseSink();
    std::size_t clampIndex(long long index) const;

    AudioOutput& m_output;
    ClockFn m_clock;
    PcmBufferPtr m_buffer;
    std::unique_ptr<PlaybackSink> m_sink;

    std::size_t m_restingIndex {0};
    std::size_t m_startIndex {0};
    Clock::time_point m_startTime {};
    double m_speed {1.0};
    bool m_running {false};
    QString m_lastError;
};
