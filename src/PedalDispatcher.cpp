#include "PedalDispatcher.h"

#include <QDebug>

PedalDispatcher::PedalDispatcher(PlaybackControl& control, PedalKeyMap keyMap, PedalTiming timing, QObject* parent)
    : QObject(parent)
    , m_control(control)
    , m_keyMap(keyMap)
    , m_timing(timing) {}

PedalRole PedalDispatcher::roleForCode(quint32 code) const {
    if (code == m_keyMap.right)
        return PedalRole::Right;
    if (code == m_keyMap.left)
        return PedalRole::Left;
    if (code == m_keyMap.middle)
        return PedalRole::Middle;
    return PedalRole::None;
}

bool PedalDispatcher::isPressed(PedalRole role) const {
    switch (role) {
    case PedalRole::Left: return m_leftPressed;
    case PedalRole::Middle: return m_middlePressed;
    case PedalRole::Right: return m_rightPressed;
    case PedalRole::None: break;
    }
    return false;
}

void PedalDispatcher::handleEvent(const RawKeyEvent& event) {
    // Autorepeat is a wire artefact, not a state input.
    if (event.value != static_cast<qint32>(KeyValue::Press) && event.value != static_cast<qint32>(KeyValue::Release))
        return;

    const bool pressed = event.value == static_cast<qint32>(KeyValue::Press);
    switch (roleForCode(event.code)) {
    case PedalRole::Right:
        onRightEdge(pressed);
        break;
    case PedalRole::Left:
        onLeftEdge(pressed);
        break;
    case PedalRole::Middle:
        onMiddleEdge(pressed);
        break;
    case PedalRole::None:
        break;
    }
}

void PedalDispatcher::onRightEdge(bool pressed) {
    if (pressed == m_rightPressed)
        return;
    m_rightPressed = pressed;

    if (!pressed) {
        m_control.pause();
        return;
    }

    PlaybackError result = m_control.seekSeconds(-m_timing.startRewindSec);
    if (result == PlaybackError::None)
        result = m_control.resume();
    if (result == PlaybackError::SinkUnavailable)
        emit playbackFailed(result);
}

void PedalDispatcher::onLeftEdge(bool pressed) {
    if (pressed == m_leftPressed)
        return;
    m_leftPressed = pressed;
    // Pressing arms an immediate first repeat on the next tick.
    m_lastRepeat.reset();
}

void PedalDispatcher::onMiddleEdge(bool pressed) {
    if (pressed == m_middlePressed)
        return;
    m_middlePressed = pressed;
    if (!pressed)
        return;

    m_control.pause();
    qInfo() << "Pedal" << "archive-requested";
    emit archiveRequested();
}

void PedalDispatcher::tick(TimePoint now) {
    if (!m_leftPressed)
        return;
    if (m_lastRepeat && now - *m_lastRepeat < m_timing.holdRepeatInterval)
        return;

    const PlaybackError result = m_control.seekSeconds(-m_timing.repeatRewindSec);
    m_lastRepeat = now;
    if (result == PlaybackError::SinkUnavailable)
        emit playbackFailed(result);
}

void PedalDispatcher::reset() {
    m_leftPressed = false;
    m_middlePressed = false;
    m_rightPressed = false;
    m_lastRepeat.reset();
}
