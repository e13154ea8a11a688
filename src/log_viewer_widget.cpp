#include "log_viewer_widget.h"
#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QScrollBar>
#include <QTextStream>
#include <QVBoxLayout>

LogViewerWidget::LogViewerWidget(QWidget* parent)
    : QWidget(parent)
    , m_palette(ThemeManager::lightPalette())
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(4);

    QHBoxLayout* toolbarLayout = new QHBoxLayout();
    toolbarLayout->setContentsMargins(0, 0, 0, 0);
    toolbarLayout->setSpacing(8);

    QLabel* titleLabel = new QLabel(tr("Log"), this);
    titleLabel->setObjectName("title");
    toolbarLayout->addWidget(titleLabel);
    toolbarLayout->addStretch();

    QLabel* filterLabel = new QLabel(tr("Level:"), this);
    filterLabel->setObjectName("muted");
    toolbarLayout->addWidget(filterLabel);

    m_filterCombo = new QComboBox(this);
    m_filterCombo->addItem(tr("All"), int(LogManager::Level::Debug));
    m_filterCombo->addItem(tr("Info+"), int(LogManager::Level::Info));
    m_filterCombo->addItem(tr("Done+"), int(LogManager::Level::Ok));
    m_filterCombo->addItem(tr("Warnings+"), int(LogManager::Level::Warn));
    m_filterCombo->addItem(tr("Errors"), int(LogManager::Level::Error));
    m_filterCombo->setCurrentIndex(1);
    connect(m_filterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &LogViewerWidget::onFilterChanged);
    toolbarLayout->addWidget(m_filterCombo);

    m_saveButton = new QPushButton(tr("Save..."), this);
    connect(m_saveButton, &QPushButton::clicked, this, &LogViewerWidget::onSaveLogs);
    toolbarLayout->addWidget(m_saveButton);

    m_clearButton = new QPushButton(tr("Clear"), this);
    connect(m_clearButton, &QPushButton::clicked, this, &LogViewerWidget::onClearLogs);
    toolbarLayout->addWidget(m_clearButton);

    mainLayout->addLayout(toolbarLayout);

    m_logTextEdit = new QTextEdit(this);
    m_logTextEdit->setReadOnly(true);
    m_logTextEdit->setObjectName("logView");
    m_logTextEdit->setStyleSheet("QTextEdit { font-family: 'Consolas', 'Courier New', monospace; font-size: 11px; }");
    mainLayout->addWidget(m_logTextEdit);

    connect(&LogManager::instance(), &LogManager::logAdded, this, &LogViewerWidget::onLogAdded);

    reload();
}

bool LogViewerWidget::passesFilter(const QString& entry, LogManager::Level minimum) {
    bool known = false;
    const LogManager::Level level = LogManager::levelFromString(LogManager::levelOf(entry), &known);
    return !known || level >= minimum;
}

QString LogViewerWidget::colorToken(LogManager::Level level) {
    switch (level) {
        case LogManager::Level::Debug: return QStringLiteral("muted");
        case LogManager::Level::Info: return QStringLiteral("text");
        case LogManager::Level::Ok: return QStringLiteral("success");
        case LogManager::Level::Warn: return QStringLiteral("warn");
        case LogManager::Level::Error:
        case LogManager::Level::Fatal: return QStringLiteral("error");
    }
    return QStringLiteral("text");
}

void LogViewerWidget::setThemePalette(const ThemeManager::Palette& palette) {
    m_palette = palette;
    reload();
}

void LogViewerWidget::onLogAdded(const QString& entry) {
    addLogToView(entry);
}

void LogViewerWidget::reload() {
    m_logTextEdit->clear();
    m_visible.clear();
    const QStringList existing = LogManager::instance().logs();
    for (const QString& entry : existing) {
        addLogToView(entry);
    }
}

void LogViewerWidget::addLogToView(const QString& entry) {
    if (!passesFilter(entry, m_minimum)) {
        return;
    }
    m_visible.append(entry);

    // Follow the tail only when the user has not scrolled up
    QScrollBar* scrollBar = m_logTextEdit->verticalScrollBar();
    const bool wasAtBottom = scrollBar->value() == scrollBar->maximum();
    m_logTextEdit->append(colorize(entry));
    if (wasAtBottom) {
        scrollBar->setValue(scrollBar->maximum());
    }
}

QString LogViewerWidget::colorize(const QString& entry) const {
    bool known = false;
    const LogManager::Level level = LogManager::levelFromString(LogManager::levelOf(entry), &known);
    const QString color = m_palette.value(known ? colorToken(level) : QStringLiteral("text"));
    const bool bold = known && level == LogManager::Level::Fatal;
    return QString("<span style='color: %1;%2'>%3</span>")
        .arg(color, bold ? QStringLiteral(" font-weight: bold;") : QString(), entry.toHtmlEscaped());
}

void LogViewerWidget::onFilterChanged(int index) {
    m_minimum = static_cast<LogManager::Level>(m_filterCombo->itemData(index).toInt());
    reload();
}

void LogViewerWidget::onClearLogs() {
    m_logTextEdit->clear();
    m_visible.clear();
    LogManager::instance().clear();
}

void LogViewerWidget::onSaveLogs() {
    const QString path = QFileDialog::getSaveFileName(this, tr("Save log"), "conversion_log.txt", tr("Text files (*.txt)"));
    if (path.isEmpty()) return;

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        QMessageBox::warning(this, tr("Save log"), tr("Cannot write %1: %2").arg(path, f.errorString()));
        return;
    }
    QTextStream ts(&f);
    for (const QString& entry : m_visible) ts << entry << '\n';
    LogManager::instance().addLog(QString("Log saved to %1").arg(path), "OK");
}
