#pragma once

#include "PlaybackControl.h"
#include "pedal/PedalTypes.h"

#include <QObject>
#include <chrono>
#include <optional>

struct PedalKeyMap {
    quint32 left {kDefaultLeftCode};
    quint32 middle {kDefaultMiddleCode};
    quint32 right {kDefaultRightCode};
};

struct PedalTiming {
    double startRewindSec {1.0};
    double repeatRewindSec {3.0};
    std::chrono::milliseconds holdRepeatInterval {500};
};

enum class PedalRole {
    None,
    Left,
    Middle,
    Right
};

// Turns raw pedal codes into transport actions:
//   right  press: short rewind then play, release: pause
//   left   held:  repeated rewind every holdRepeatInterval
//   middle press: pause and request archiving
// Each button is a Released/Pressed state machine; only a change of state
// acts, so duplicate presses or releases are ignored.
class PedalDispatcher : public QObject {
    Q_OBJECT
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    PedalDispatcher(PlaybackControl& control, PedalKeyMap keyMap, PedalTiming timing, QObject* parent = nullptr);

    void setKeyMap(const PedalKeyMap& keyMap) { m_keyMap = keyMap; }
    void setTiming(const PedalTiming& timing) { m_timing = timing; }
    const PedalKeyMap& keyMap() const noexcept { return m_keyMap; }
    const PedalTiming& timing() const noexcept { return m_timing; }

    void handleEvent(const RawKeyEvent& event);
    void tick(TimePoint now);
    void reset();

    PedalRole roleForCode(quint32 code) const;
    bool isPressed(PedalRole role) const;
    bool leftHeld() const noexcept { return m_leftPressed; }

signals:
    void archiveRequested();
    void playbackFailed(PlaybackError error);

private:
    void onRightEdge(bool pressed);
    void onLeftEdge(bool pressed);
    void onMiddleEdge(bool pressed);

    PlaybackControl& m_control;
    PedalKeyMap m_keyMap;
    PedalTiming m_timing;

    bool m_leftPressed {false};
    bool m_middlePressed {false};
    bool m_rightPressed {false};
    std::optional<TimePoint> m_lastRepeat;
};
