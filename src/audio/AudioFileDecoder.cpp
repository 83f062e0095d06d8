#include "AudioFileDecoder.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include <sndfile.h>

#include <memory>
#include <vector>

namespace {
constexpr sf_count_t kReadChunkFrames = 16384;

struct SndFileCloser {
    void operator()(SNDFILE* handle) const {
        if (handle)
            sf_close(handle);
    }
};

using SndFileHandle = std::unique_ptr<SNDFILE, SndFileCloser>;

void setError(QString* error, const QString& text) {
    if (error)
        *error = text;
}
}

PcmBufferPtr AudioFileDecoder::decode(const QString& filePath, QString* error) {
    if (filePath.isEmpty()) {
        setError(error, QStringLiteral("No file given"));
        return nullptr;
    }

    if (!QFileInfo::exists(filePath)) {
        setError(error, QStringLiteral("File '%1' not found").arg(filePath));
        return nullptr;
    }

    SF_INFO info {};
    const QByteArray encoded = QFile::encodeName(filePath);
    SndFileHandle handle(sf_open(encoded.constData(), SFM_READ, &info));
    if (!handle) {
        setError(error, QStringLiteral("Unable to decode '%1': %2")
                            .arg(filePath, QString::fromUtf8(sf_strerror(nullptr))));
        return nullptr;
    }

    if (info.channels < 1 || info.channels > 2) {
        setError(error, QStringLiteral("Unsupported channel count: %1 (only mono/stereo supported)")
                            .arg(info.channels));
        return nullptr;
    }

    if (info.samplerate <= 0) {
        setError(error, QStringLiteral("Missing sample rate in '%1'").arg(filePath));
        return nullptr;
    }

    auto buffer = std::make_shared<PcmBuffer>();
    buffer->sampleRate = info.samplerate;
    buffer->channels = info.channels;
    if (info.frames > 0)
        buffer->samples.reserve(static_cast<std::size_t>(info.frames) * static_cast<std::size_t>(info.channels));

    // Frame counts reported by compressed formats are estimates, so read until EOF.
    std::vector<float> chunk(static_cast<std::size_t>(kReadChunkFrames) * static_cast<std::size_t>(info.channels));
    while (true) {
        const sf_count_t read = sf_readf_float(handle.get(), chunk.data(), kReadChunkFrames);
        if (read <= 0)
            break;
        buffer->samples.insert(buffer->samples.end(),
                               chunk.begin(),
                               chunk.begin() + static_cast<std::ptrdiff_t>(read * info.channels));
    }

    if (sf_error(handle.get()) != SF_ERR_NO_ERROR) {
        qWarning() << "Decoder" << "short-read" << filePath
                   << QString::fromUtf8(sf_strerror(handle.get()));
    }

    if (buffer->samples.empty()) {
        setError(error, QStringLiteral("'%1' contains no audio").arg(filePath));
        return nullptr;
    }

    qInfo() << "Decoder" << "decoded" << QFileInfo(filePath).fileName()
            << "sr" << buffer->sampleRate
            << "ch" << buffer->channels
            << "frames" << static_cast<qulonglong>(buffer->totalFrames())
            << "seconds" << QString::number(buffer->durationSec(), 'f', 3);
    return buffer;
}

QStringList AudioFileDecoder::supportedSuffixes() {
    return {QStringLiteral("wav"), QStringLiteral("flac"), QStringLiteral("ogg"),
            QStringLiteral("opus"), QStringLiteral("mp3")};
}
