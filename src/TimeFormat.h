#pragma once

#include <QString>
#include <QtGlobal>
#include <cstddef>

// "mm:ss / mm:ss", or "hh:mm:ss / hh:mm:ss" once the total reaches an hour.
QString formatClock(quint64 currentSecs, quint64 totalSecs);

// Whole seconds from a frame index, floored. Zero for an unknown rate.
quint64 secondsFromFrames(std::size_t frames, int sampleRate);
