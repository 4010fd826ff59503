#pragma once

#include <QString>

#include "ExtensionClassifier.h"

class QSettings;

class TransferSettings
{
public:
    enum class SelectionMode {
        TimeWindow = 0,
        FixedCount
    };

    static constexpr int defaultTimeWindowMinutes = 40;
    static constexpr int defaultMaxFiles = 10;

    static QString defaultVideoExtensions();
    static QString defaultPhotoExtensions();

    TransferSettings();

    void load(QSettings &settings);
    void save(QSettings &settings) const;

    SelectionMode mode() const { return m_mode; }
    void setMode(SelectionMode mode) { m_mode = mode; }
    static QString modeName(SelectionMode mode);
    static bool parseMode(const QString &name, SelectionMode *mode);

    QString timeWindowText() const { return m_timeWindowText; }
    void setTimeWindowText(const QString &text) { m_timeWindowText = text; }
    QString maxFilesText() const { return m_maxFilesText; }
    void setMaxFilesText(const QString &text) { m_maxFilesText = text; }

    int timeWindowMinutes() const;
    int maxFiles() const;

    static int coerceTimeWindow(const QString &text, bool *coerced = nullptr);
    static int coerceMaxFiles(const QString &text, bool *coerced = nullptr);
    bool coerceActiveValue(QString *key, QString *value);

    bool transferVideos() const { return m_enabled.videos; }
    void setTransferVideos(bool enabled) { m_enabled.videos = enabled; }
    bool transferPhotos() const { return m_enabled.photos; }
    void setTransferPhotos(bool enabled) { m_enabled.photos = enabled; }
    EnabledCategories enabledCategories() const { return m_enabled; }

    QString videoExtensions() const { return m_videoExtensions; }
    void setVideoExtensions(const QString &list) { m_videoExtensions = list; }
    QString photoExtensions() const { return m_photoExtensions; }
    void setPhotoExtensions(const QString &list) { m_photoExtensions = list; }

    QString logFilePath() const { return m_logFilePath; }
    void setLogFilePath(const QString &path) { m_logFilePath = path; }

    ExtensionClassifier classifier() const;

    static void writeBack(QSettings &settings, const QString &key, const QString &value);

private:
    SelectionMode m_mode = SelectionMode::TimeWindow;
    QString m_timeWindowText;
    QString m_maxFilesText;
    EnabledCategories m_enabled;
    QString m_videoExtensions;
    QString m_photoExtensions;
    QString m_logFilePath;
};
