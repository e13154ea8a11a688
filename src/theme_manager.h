#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

class QApplication;

// Light/dark/custom colour themes. Every theme is a map of the tokens
// bg, panel, text, muted, accent, accent_alt, border, success, warn, error
// to "#RRGGBB" colours; the stylesheet is generated from those tokens.
class ThemeManager
{
public:
    enum class Mode {
        Light,
        Dark,
        Custom,
    };

    using Palette = QMap<QString, QString>;

    explicit ThemeManager(const QString& modeArgument = QString());

    bool hadInvalidMode() const { return !m_invalidMode.isEmpty(); }
    QString invalidMode() const { return m_invalidMode; }

    Mode mode() const { return m_mode; }
    QString modeName() const { return modeToString(m_mode); }
    void setMode(Mode mode) { m_mode = mode; }

    // Custom theme file location; defaults to customThemePath()
    void setCustomThemeFile(const QString& path) { m_customFile = path; }
    QString customThemeFile() const { return m_customFile; }

    // Palette for the current mode. Custom falls back to light when its file
    // is missing or unreadable; usedFallback reports that.
    Palette palette(bool* usedFallback = nullptr) const;

    void apply(QApplication& app) const;

    static QString modeToString(Mode mode);
    static Mode modeFromString(const QString& name, bool* ok = nullptr);
    static QStringList tokenNames();
    static Palette lightPalette();
    static Palette darkPalette();
    static QString customThemePath();

    // Reads a JSON object of token -> colour and merges it over the light palette.
    // Unknown tokens and invalid colours are ignored.
    static bool loadCustomPalette(const QString& path, Palette& out, QString* errorMessage = nullptr);
    static QString styleSheet(const Palette& palette);

private:
    Mode m_mode = Mode::Light;
    QString m_invalidMode;
    QString m_customFile;
};
