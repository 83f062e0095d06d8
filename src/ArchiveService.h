#pragma once

#include <QDateTime>
#include <QString>

// Moves finished recordings into <root>/YYYY/MM/<stem>_YYYYMMDD_HHMMSS.<ext>.
class ArchiveService {
public:
    explicit ArchiveService(QString archiveRoot = QStringLiteral("./archive"));

    const QString& archiveRoot() const noexcept { return m_root; }

    bool archive(const QString& sourcePath, QString* destination, QString* error = nullptr) const;
    bool archive(const QString& sourcePath, const QDateTime& when, QString* destination,
                 QString* error = nullptr) const;

    QString destinationFor(const QString& sourcePath, const QDateTime& when) const;

private:
    QString m_root;
};
