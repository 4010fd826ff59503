#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QVariantMap>

#include <memory>

#include "ExtensionClassifier.h"
#include "MediaTypes.h"
#include "TransferSettings.h"
#include "TransferProgress.h"
#include "TransferSummary.h"

class TransferLog;

class TransferOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle = 0,
        Scanning,
        Selecting,
        Indexing,
        Planning,
        NoWork,
        Copying,
        Summarizing,
        Failed
    };
    Q_ENUM(State)

    static QString sessionFolderName(const QDateTime &time);
    static QString videosFolderName();
    static QString photosFolderName();

    TransferOrchestrator(const QString &sourceRoot,
                         const QString &destinationRoot,
                         const TransferSettings &settings,
                         TransferProgress *progress,
                         TransferLog *log,
                         QObject *parent = nullptr);

    State state() const { return m_state; }
    TransferSettings settings() const { return m_settings; }
    TransferPlan plan() const { return m_plan; }

    void setDryRun(bool dryRun) { m_dryRun = dryRun; }
    void setSessionTime(const QDateTime &time) { m_sessionTime = time; }

public slots:
    void start();

signals:
    void stateChanged(TransferOrchestrator::State state);
    void reportingStarted();
    void reportingStopped();
    void settingsCoerced(const QString &key, const QString &value);
    void failed(const QString &message);
    void finished(const QVariantMap &result);

private:
    bool run(QVariantMap &result, QString *error);
    bool copyPlannedFiles(const QString &sessionFolder, QString *error);
    void setState(State state);
    void log(const QString &message);
    void startReporting();
    void stopReporting();
    void finishNoWork(QVariantMap &result, const QString &message);
    void logPlan();

    QString m_sourceRoot;
    QString m_destinationRoot;
    TransferSettings m_settings;
    ExtensionClassifier m_classifier;
    std::unique_ptr<TransferProgress> m_ownedProgress;
    TransferProgress *m_progress = nullptr;
    TransferLog *m_log = nullptr;
    TransferPlan m_plan;
    TransferSummary m_summary;
    QDateTime m_sessionTime;
    State m_state = State::Idle;
    bool m_dryRun = false;
    bool m_reporting = false;
};
