#pragma once

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include "MediaTypes.h"

class TransferLog : public QObject
{
    Q_OBJECT

public:
    explicit TransferLog(QObject *parent = nullptr);
    ~TransferLog() override;

    bool setLogFilePath(const QString &path, QString *error);
    QStringList lines() const;
    LogCallback callback();

    static QString formatLine(const QDateTime &time, const QString &message);

public slots:
    void append(const QString &message);

signals:
    void lineAppended(const QString &line);

private:
    mutable QMutex m_mutex;
    QStringList m_lines;
    QFile m_file;
};
