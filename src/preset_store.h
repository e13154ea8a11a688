#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QMap>

// Named conversion option bundles. Built-in presets are always present;
// user presets from the JSON file override them by name.
class PresetStore {
public:
    explicit PresetStore(const QString& filePath = QString());

    static QString defaultFilePath();
    static QMap<QString, QVariantMap> builtInPresets();

    QString filePath() const { return m_filePath; }

    // Missing file -> built-ins only. Malformed file -> built-ins only and false with errorMessage set.
    bool load(QString* errorMessage = nullptr);
    bool save(QString* errorMessage = nullptr) const;

    QStringList names() const;
    bool contains(const QString& name) const { return m_presets.contains(name); }
    QVariantMap preset(const QString& name) const { return m_presets.value(name); }

    // Rejects blank names
    bool upsert(const QString& name, const QVariantMap& values);
    bool remove(const QString& name);

private:
    QString m_filePath;
    QMap<QString, QVariantMap> m_presets;
};
