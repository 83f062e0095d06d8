#include "PedalTypes.h"

QString PedalStatus::describe() const {
    switch (state) {
    case State::NotStarted:
        return QStringLiteral("Not started");
    case State::Scanning:
        return QStringLiteral("Scanning for pedal...");
    case State::Connected:
        return QStringLiteral("Connected: %1 (%2:%3) %4")
            .arg(name)
            .arg(vendorId, 4, 16, QLatin1Char('0'))
            .arg(productId, 4, 16, QLatin1Char('0'))
            .arg(path);
    case State::Error:
        return QStringLiteral("Error: %1").arg(message);
    }
    return {};
}
