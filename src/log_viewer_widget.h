#ifndef LOG_VIEWER_WIDGET_H
#define LOG_VIEWER_WIDGET_H

#include <QWidget>
#include <QTextEdit>
#include <QComboBox>
#include <QPushButton>

#include "log_manager.h"
#include "theme_manager.h"

// Conversion log panel of the widgets window: level filter, themed colours,
// clear and save-to-file.
class LogViewerWidget : public QWidget {
    Q_OBJECT

public:
    explicit LogViewerWidget(QWidget* parent = nullptr);

    void setThemePalette(const ThemeManager::Palette& palette);

    // Entries without a level tag always pass
    static bool passesFilter(const QString& entry, LogManager::Level minimum);
    // Palette token used for an entry's level
    static QString colorToken(LogManager::Level level);

    QStringList visibleEntries() const { return m_visible; }

private slots:
    void onLogAdded(const QString& entry);
    void onFilterChanged(int index);
    void onClearLogs();
    void onSaveLogs();

private:
    void reload();
    void addLogToView(const QString& entry);
    QString colorize(const QString& entry) const;

    QTextEdit* m_logTextEdit;
    QComboBox* m_filterCombo;
    QPushButton* m_clearButton;
    QPushButton* m_saveButton;
    LogManager::Level m_minimum = LogManager::Level::Info;
    QStringList m_visible;
    ThemeManager::Palette m_palette;
};

#endif // LOG_VIEWER_WIDGET_H
