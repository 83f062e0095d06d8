#pragma once

#include "PcmBuffer.h"

#include <QString>
#include <QStringList>

class AudioFileDecoder {
public:
    // Reads the whole file into memory. Returns nullptr and fills |error| on failure.
    static PcmBufferPtr decode(const QString& filePath, QString* error = nullptr);

    static QStringList supportedSuffixes();
};
