#pragma once

#include <QString>
#include <memory>

// Pull-based producer of interleaved float frames. Called from the output
// backend's delivery thread only.
class SampleSource {
public:
    virtual ~SampleSource() = default;

    // Writes up to |frames| frames of |outChannels| interleaved samples into
    // |dst| and returns how many frames were produced. Fewer than requested
    // means the source is exhausted.
    virtual int read(float* dst, int frames, int outChannels) = 0;
    virtual bool exhausted() const = 0;
};

// One playable stream bound to the process audio device.
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    virtual void append(std::unique_ptr<SampleSource> source) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual bool isPlaying() const = 0;
    virtual int outputSampleRate() const = 0;
};

class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    // |sampleRate| is the rate the caller would like; sinks report the rate
    // they actually render at through outputSampleRate().
    virtual std::unique_ptr<PlaybackSink> createSink(int channels, int sampleRate, QString* error) = 0;
    virtual QString backendName() const = 0;
};

// JACK first, Qt Multimedia as fallback. Never returns nullptr.
std::unique_ptr<AudioOutput> createAudioOutput();
