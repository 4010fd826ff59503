#pragma once

#include <QString>
#include <QVector>

#include <memory>

#include "ExtensionClassifier.h"
#include "MediaTypes.h"

class TransferSettings;

class SelectionPolicy
{
public:
    virtual ~SelectionPolicy() = default;

    virtual SelectionResult select(const QVector<MediaFile> &candidates,
                                   const ExtensionClassifier &classifier,
                                   const LogCallback &log = LogCallback()) const = 0;
    virtual QString description() const = 0;
};

/**
 * @brief Selects, per category, every file modified within a window before the latest file.
 */
class TimeWindowPolicy : public SelectionPolicy
{
public:
    explicit TimeWindowPolicy(int windowMinutes);

    SelectionResult select(const QVector<MediaFile> &candidates,
                           const ExtensionClassifier &classifier,
                           const LogCallback &log = LogCallback()) const override;
    QString description() const override;

    int windowMinutes() const { return m_windowMinutes; }

private:
    int m_windowMinutes = 0;
};

/**
 * @brief Selects the most recently modified files across all enabled categories.
 */
class FixedCountPolicy : public SelectionPolicy
{
public:
    explicit FixedCountPolicy(int maxFiles);

    SelectionResult select(const QVector<MediaFile> &candidates,
                           const ExtensionClassifier &classifier,
                           const LogCallback &log = LogCallback()) const override;
    QString description() const override;

    int maxFiles() const { return m_maxFiles; }

private:
    int m_maxFiles = 0;
};

std::unique_ptr<SelectionPolicy> createSelectionPolicy(const TransferSettings &settings);
