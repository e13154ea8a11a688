#include "theme_manager.h"
#include "log_manager.h"

#include <QApplication>
#include <QColor>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QPalette>
#include <QStandardPaths>

#include <algorithm>

ThemeManager::ThemeManager(const QString& modeArgument)
    : m_customFile(customThemePath())
{
    const QString normalized = modeArgument.trimmed().toLower();
    if (normalized.isEmpty()) {
        m_mode = Mode::Light;
        return;
    }

    bool ok = false;
    m_mode = modeFromString(normalized, &ok);
    if (!ok) {
        m_mode = Mode::Light;
        m_invalidMode = modeArgument;
    }
}

QString ThemeManager::modeToString(Mode mode)
{
    switch (mode) {
    case Mode::Light:
        return QStringLiteral("light");
    case Mode::Dark:
        return QStringLiteral("dark");
    case Mode::Custom:
        return QStringLiteral("custom");
    }
    return QStringLiteral("light");
}

ThemeManager::Mode ThemeManager::modeFromString(const QString& name, bool* ok)
{
    const QString n = name.trimmed().toLower();
    if (ok) *ok = true;
    if (n == "light") return Mode::Light;
    if (n == "dark") return Mode::Dark;
    if (n == "custom") return Mode::Custom;
    if (ok) *ok = false;
    return Mode::Light;
}

QStringList ThemeManager::tokenNames()
{
    return {"bg", "panel", "text", "muted", "accent", "accent_alt", "border", "success", "warn", "error"};
}

ThemeManager::Palette ThemeManager::lightPalette()
{
    return {
        {"bg", "#F9FAFB"},
        {"panel", "#FFFFFF"},
        {"text", "#111827"},
        {"muted", "#6B7280"},
        {"accent", "#2563EB"},
        {"accent_alt", "#1D4ED8"},
        {"border", "#E5E7EB"},
        {"success", "#0F766E"},
        {"warn", "#B45309"},
        {"error", "#B91C1C"},
    };
}

ThemeManager::Palette ThemeManager::darkPalette()
{
    return {
        {"bg", "#0F172A"},
        {"panel", "#111827"},
        {"text", "#F8FAFC"},
        {"muted", "#94A3B8"},
        {"accent", "#3B82F6"},
        {"accent_alt", "#2563EB"},
        {"border", "#1F2937"},
        {"success", "#34D399"},
        {"warn", "#FBBF24"},
        {"error", "#F87171"},
    };
}

QString ThemeManager::customThemePath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("custom_theme.json");
}

bool ThemeManager::loadCustomPalette(const QString& path, Palette& out, QString* errorMessage)
{
    QFile f(path);
    if (!f.exists()) {
        if (errorMessage) *errorMessage = QString("Custom theme file not found: %1").arg(path);
        return false;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorMessage) *errorMessage = f.errorString();
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = perr.error != QJsonParseError::NoError ? perr.errorString()
                                                                   : QStringLiteral("Root is not a JSON object");
        }
        return false;
    }

    Palette merged = lightPalette();
    const QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!merged.contains(it.key()) || !it.value().isString()) continue;
        const QColor c(it.value().toString().trimmed());
        if (!c.isValid()) continue;
        merged.insert(it.key(), c.name().toUpper());
    }
    out = merged;
    return true;
}

ThemeManager::Palette ThemeManager::palette(bool* usedFallback) const
{
    if (usedFallback) *usedFallback = false;
    switch (m_mode) {
    case Mode::Dark:
        return darkPalette();
    case Mode::Custom: {
        Palette p;
        QString err;
        if (loadCustomPalette(m_customFile, p, &err)) return p;
        if (usedFallback) *usedFallback = true;
        LogManager::instance().addLog(QString("Custom theme unavailable (%1), using light").arg(err), "WARN");
        return lightPalette();
    }
    case Mode::Light:
    default:
        return lightPalette();
    }
}

QString ThemeManager::styleSheet(const Palette& p)
{
    QString qss = QStringLiteral(
        "QWidget { background-color: @bg; color: @text; }"
        "QMainWindow, QDialog { background-color: @bg; }"
        "QFrame#card, QGroupBox { background-color: @panel; border: 1px solid @border; border-radius: 8px; }"
        "QGroupBox { margin-top: 14px; padding-top: 6px; }"
        "QGroupBox::title { subcontrol-origin: margin; left: 10px; padding: 0 4px; color: @muted; }"
        "QLabel#muted { color: @muted; }"
        "QLabel#title { font-size: 16px; font-weight: bold; }"
        "QLineEdit, QSpinBox, QDoubleSpinBox, QComboBox, QTextEdit, QPlainTextEdit, QListWidget, QListView {"
        " background-color: @panel; color: @text; border: 1px solid @border; border-radius: 6px; padding: 3px 6px; }"
        "QLineEdit:focus, QSpinBox:focus, QDoubleSpinBox:focus, QComboBox:focus { border: 1px solid @accent; }"
        "QComboBox QAbstractItemView { background-color: @panel; color: @text; selection-background-color: @accent; }"
        "QListView::item:selected, QListWidget::item:selected { background-color: @accent; color: #FFFFFF; }"
        "QPushButton { background-color: @panel; color: @text; border: 1px solid @border; border-radius: 6px; padding: 5px 12px; }"
        "QPushButton:hover { border-color: @accent; }"
        "QPushButton:disabled { color: @muted; }"
        "QPushButton#primary { background-color: @accent; color: #FFFFFF; border: none; }"
        "QPushButton#primary:hover { background-color: @accent_alt; }"
        "QPushButton#danger { color: @error; }"
        "QTabWidget::pane { border: 1px solid @border; border-radius: 6px; background-color: @panel; }"
        "QTabBar::tab { background-color: @bg; color: @muted; padding: 6px 12px; border: 1px solid @border; border-bottom: none; }"
        "QTabBar::tab:selected { background-color: @panel; color: @text; }"
        "QProgressBar { background-color: @bg; border: 1px solid @border; border-radius: 5px; text-align: center; height: 12px; }"
        "QProgressBar::chunk { background-color: @accent; border-radius: 5px; }"
        "QCheckBox::indicator:checked { background-color: @accent; border: 1px solid @accent_alt; }"
        "QToolTip { background-color: @panel; color: @text; border: 1px solid @border; }");

    // Longest tokens first so "@accent" does not clobber "@accent_alt"
    QStringList tokens = p.keys();
    std::sort(tokens.begin(), tokens.end(), [](const QString& a, const QString& b) { return a.size() > b.size(); });
    for (const QString& token : tokens) {
        qss.replace("@" + token, p.value(token));
    }
    return qss;
}

void ThemeManager::apply(QApplication& app) const
{
    const Palette p = palette();

    QPalette pal = app.palette();
    pal.setColor(QPalette::Window, QColor(p.value("bg")));
    pal.setColor(QPalette::WindowText, QColor(p.value("text")));
    pal.setColor(QPalette::Base, QColor(p.value("panel")));
    pal.setColor(QPalette::AlternateBase, QColor(p.value("bg")));
    pal.setColor(QPalette::Text, QColor(p.value("text")));
    pal.setColor(QPalette::Button, QColor(p.value("panel")));
    pal.setColor(QPalette::ButtonText, QColor(p.value("text")));
    pal.setColor(QPalette::Highlight, QColor(p.value("accent")));
    pal.setColor(QPalette::HighlightedText, QColor("#FFFFFF"));
    pal.setColor(QPalette::PlaceholderText, QColor(p.value("muted")));
    app.setPalette(pal);
    app.setStyleSheet(styleSheet(p));
}
