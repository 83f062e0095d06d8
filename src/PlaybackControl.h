#pragma once

enum class PlaybackError {
    None,
    NotLoaded,
    SinkUnavailable
};

// The subset of transport operations the pedal dispatcher drives.
class PlaybackControl {
public:
    virtual ~PlaybackControl() = default;

    virtual PlaybackError resume() = 0;
    virtual void pause() = 0;
    virtual PlaybackError seekSeconds(double deltaSeconds) = 0;
    virtual bool isPlaying() const = 0;
};
