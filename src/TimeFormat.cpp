#include "TimeFormat.h"

namespace {
QString twoDigits(quint64 value) {
    return QStringLiteral("%1").arg(value, 2, 10, QLatin1Char('0'));
}

QString minutesSeconds(quint64 secs) {
    return twoDigits(secs / 60) + QLatin1Char(':') + twoDigits(secs % 60);
}

QString hoursMinutesSeconds(quint64 secs) {
    return twoDigits(secs / 3600) + QLatin1Char(':') + twoDigits((secs % 3600) / 60) + QLatin1Char(':')
        + twoDigits(secs % 60);
}
}

QString formatClock(quint64 currentSecs, quint64 totalSecs) {
    if (totalSecs >= 3600)
        return hoursMinutesSeconds(currentSecs) + QStringLiteral(" / ") + hoursMinutesSeconds(totalSecs);
    return minutesSeconds(currentSecs) + QStringLiteral(" / ") + minutesSeconds(totalSecs);
}

quint64 secondsFromFrames(std::size_t frames, int sampleRate) {
    if (sampleRate <= 0)
        return 0;
    return static_cast<quint64>(frames) / static_cast<quint64>(sampleRate);
}
