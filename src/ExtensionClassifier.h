#pragma once

#include <QSet>
#include <QString>

#include "MediaTypes.h"

class ExtensionClassifier
{
public:
    ExtensionClassifier() = default;
    ExtensionClassifier(const QSet<QString> &videoExtensions,
                        const QSet<QString> &photoExtensions,
                        EnabledCategories enabled = EnabledCategories());
    ExtensionClassifier(const QString &videoList,
                        const QString &photoList,
                        EnabledCategories enabled = EnabledCategories());

    static QString normalizeExtension(const QString &extension);
    static QSet<QString> parseExtensionList(const QString &list);
    static MediaCategory classify(const QString &extension,
                                  const QSet<QString> &videoExtensions,
                                  const QSet<QString> &photoExtensions);

    MediaCategory categoryOf(const QString &extension) const;
    MediaCategory categoryOf(const MediaFile &file) const;
    bool isEnabled(MediaCategory category) const;
    bool hasEnabledCategory() const;

    const QSet<QString> &videoExtensions() const { return m_videoExtensions; }
    const QSet<QString> &photoExtensions() const { return m_photoExtensions; }
    EnabledCategories enabled() const { return m_enabled; }

private:
    QSet<QString> m_videoExtensions;
    QSet<QString> m_photoExtensions;
    EnabledCategories m_enabled;
};
