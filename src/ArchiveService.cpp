#include "ArchiveService.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <utility>

ArchiveService::ArchiveService(QString archiveRoot)
    : m_root(std::move(archiveRoot)) {
}

QString ArchiveService::destinationFor(const QString& sourcePath, const QDateTime& when) const {
    const QFileInfo info(sourcePath);
    const QDate day = when.date();
    const QString dir = QDir(m_root).filePath(QStringLiteral("%1/%2")
                                                  .arg(day.year(), 4, 10, QLatin1Char('0'))
                                                  .arg(day.month(), 2, 10, QLatin1Char('0')));
    QString name = info.completeBaseName() + QLatin1Char('_')
        + when.toString(QStringLiteral("yyyyMMdd_HHmmss"));
    if (!info.suffix().isEmpty())
        name += QLatin1Char('.') + info.suffix();
    return QDir(dir).filePath(name);
}

bool ArchiveService::archive(const QString& sourcePath, QString* destination, QString* error) const {
    return archive(sourcePath, QDateTime::currentDateTime(), destination, error);
}

bool ArchiveService::archive(const QString& sourcePath, const QDateTime& when, QString* destination,
                             QString* error) const {
    const QFileInfo info(sourcePath);
    if (info.fileName().isEmpty() || !info.isFile()) {
        if (error)
            *error = QStringLiteral("Invalid source file '%1'").arg(sourcePath);
        return false;
    }

    const QString target = destinationFor(sourcePath, when);
    const QString targetDir = QFileInfo(target).absolutePath();
    if (!QDir().mkpath(targetDir)) {
        if (error)
            *error = QStringLiteral("Create archive directory failed: %1").arg(targetDir);
        return false;
    }

    if (QFile::rename(sourcePath, target)) {
        qInfo() << "Archive" << "renamed" << sourcePath << "->" << target;
    } else {
        QFile source(sourcePath);
        if (!source.copy(target)) {
            if (error)
                *error = QStringLiteral("Copy failed: %1").arg(source.errorString());
            return false;
        }
        if (!QFile::remove(sourcePath)) {
            if (error)
                *error = QStringLiteral("Delete original failed: %1").arg(sourcePath);
            return false;
        }
        qInfo() << "Archive" << "copied" << sourcePath << "->" << target;
    }

    if (destination)
        *destination = target;
    return true;
}
