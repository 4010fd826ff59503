#pragma once

#include <QString>
#include <QtGlobal>

class TransferProgress;

struct CopyResult {
    qint64 bytesCopied = 0;
    qint64 elapsedMs = 0;
    bool timesPreserved = false;
};

class CopyEngine
{
public:
    static constexpr qint64 bufferSize = 1024 * 1024;

    explicit CopyEngine(TransferProgress *progress = nullptr);

    bool copyFile(const QString &sourcePath,
                  const QString &targetPath,
                  qint64 expectedSize,
                  CopyResult *result,
                  QString *error);

private:
    bool fail(const QString &targetPath, const QString &message, QString *error) const;

    TransferProgress *m_progress = nullptr;
};
