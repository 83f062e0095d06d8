#include "audio/AudioFileDecoder.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include <vector>

using testing_support::writeWav;

TEST(AudioFileDecoderTest, DecodesStereoWavToInterleavedFloats) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("dictation.wav"));
    ASSERT_TRUE(writeWav(path, 2, 8000, {0.f, 0.5f, 0.25f, -0.25f, -0.5f, 1.f}));

    QString error;
    const PcmBufferPtr buffer = AudioFileDecoder::decode(path, &error);
    ASSERT_TRUE(buffer) << error.toStdString();
    EXPECT_EQ(buffer->sampleRate, 8000);
    EXPECT_EQ(buffer->channels, 2);
    EXPECT_EQ(buffer->totalSamples(), 6u);
    EXPECT_EQ(buffer->totalFrames(), 3u);
    EXPECT_FLOAT_EQ(buffer->samples[1], 0.5f);
    EXPECT_FLOAT_EQ(buffer->samples[3], -0.25f);
}

TEST(AudioFileDecoderTest, RejectsMoreThanTwoChannels) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("surround.wav"));
    ASSERT_TRUE(writeWav(path, 3, 8000, std::vector<float>(30, 0.1f)));

    QString error;
    EXPECT_FALSE(AudioFileDecoder::decode(path, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("Unsupported channel count: 3")));
}

TEST(AudioFileDecoderTest, MissingFileReportsNotFound) {
    QString error;
    EXPECT_FALSE(AudioFileDecoder::decode(QStringLiteral("/nonexistent/take1.wav"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("not found")));
}

TEST(AudioFileDecoderTest, GarbageFileFailsToDecode) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("notes.wav"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("this is not audio at all");
    file.close();

    QString error;
    EXPECT_FALSE(AudioFileDecoder::decode(path, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Unable to decode")));
}
