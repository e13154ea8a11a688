#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QLabel>
#include <QPushButton>
#include <QLineEdit>
#include <QComboBox>
#include <QCheckBox>
#include <QSpinBox>
#include <QListView>
#include <QListWidget>
#include <QProgressBar>
#include <QTabWidget>
#include <QVariantMap>

#include "conversion_settings.h"
#include "theme_manager.h"

class ConverterBackend;
class LogViewerWidget;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(ConverterBackend* backend, const ThemeManager& theme, QWidget *parent = nullptr);
    ~MainWindow() override;

    // Raw form values keyed like ConversionSettings::toPresetMap()
    QVariantMap collectFormMap() const;
    void applyFormMap(const QVariantMap& map);

protected:
    void closeEvent(QCloseEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private slots:
    void onBrowseFfmpeg();
    void onCheckFfmpeg();
    void onBrowseOutputDir();
    void onAddFiles();
    void onAddFolder();
    void onRemoveSelected();
    void onClearQueue();
    void onQueueCurrentChanged(const QModelIndex &current);
    void onStart();
    void onStop();
    void onSavePreset();
    void onLoadPreset();
    void onDeletePreset();
    void onThemeChanged(int index);
    void onLanguageChanged(int index);
    void onUpscale(const QString &label, int width, int height);

    void refreshEncoderInfo();
    void refreshRunning();
    void refreshProgress();
    void refreshMediaInfo();
    void refreshPresets();

private:
    QWidget* buildHeader();
    QWidget* buildQueuePanel();
    QWidget* buildBasicPage();
    QWidget* buildEditPage();
    QWidget* buildCodecPage();
    QWidget* buildPresetsPage();
    QWidget* buildEnhancePage();
    QWidget* buildMetadataPage();
    QWidget* buildStatusCard();

    void pickColor(QLineEdit* target);
    void pickFile(QLineEdit* target, const QString& title, const QString& filter);
    void applyTheme();

    ConverterBackend* m_backend;
    ThemeManager m_theme;

    // Header
    QLineEdit* m_ffmpegEdit = nullptr;
    QLabel* m_encoderLabel = nullptr;
    QComboBox* m_themeCombo = nullptr;
    QComboBox* m_langCombo = nullptr;

    // Queue
    QListView* m_queueView = nullptr;
    QPushButton* m_addFilesBtn = nullptr;
    QPushButton* m_addFolderBtn = nullptr;
    QPushButton* m_removeBtn = nullptr;
    QPushButton* m_clearBtn = nullptr;
    QLineEdit* m_outDirEdit = nullptr;
    QLabel* m_infoName = nullptr;
    QLabel* m_infoDuration = nullptr;
    QLabel* m_infoCodec = nullptr;
    QLabel* m_infoRes = nullptr;
    QLabel* m_infoSize = nullptr;
    QLabel* m_infoContainer = nullptr;

    // Basic
    QComboBox* m_videoFmt = nullptr;
    QComboBox* m_imageFmt = nullptr;
    QSpinBox* m_crf = nullptr;
    QComboBox* m_encPreset = nullptr;
    QComboBox* m_portrait = nullptr;
    QSpinBox* m_imgQuality = nullptr;
    QCheckBox* m_overwrite = nullptr;
    QCheckBox* m_fastCopy = nullptr;

    // Edit
    QLineEdit* m_trimStart = nullptr;
    QLineEdit* m_trimEnd = nullptr;
    QCheckBox* m_merge = nullptr;
    QLineEdit* m_mergeName = nullptr;
    QLineEdit* m_resizeW = nullptr;
    QLineEdit* m_resizeH = nullptr;
    QLineEdit* m_cropW = nullptr;
    QLineEdit* m_cropH = nullptr;
    QLineEdit* m_cropX = nullptr;
    QLineEdit* m_cropY = nullptr;
    QComboBox* m_rotate = nullptr;
    QLineEdit* m_speed = nullptr;
    QLineEdit* m_wmPath = nullptr;
    QComboBox* m_wmPos = nullptr;
    QSpinBox* m_wmOpacity = nullptr;
    QSpinBox* m_wmScale = nullptr;
    QLineEdit* m_textWm = nullptr;
    QComboBox* m_textPos = nullptr;
    QSpinBox* m_textSize = nullptr;
    QLineEdit* m_textColor = nullptr;
    QCheckBox* m_textBox = nullptr;
    QLineEdit* m_textBoxColor = nullptr;
    QSpinBox* m_textBoxOpacity = nullptr;
    QLineEdit* m_textFont = nullptr;

    // Codec
    QComboBox* m_codec = nullptr;
    QComboBox* m_hw = nullptr;

    // Presets
    QListWidget* m_presetList = nullptr;
    QLineEdit* m_presetName = nullptr;

    // Metadata
    QCheckBox* m_stripMeta = nullptr;
    QCheckBox* m_copyMeta = nullptr;
    QLineEdit* m_metaTitle = nullptr;
    QLineEdit* m_metaComment = nullptr;
    QLineEdit* m_metaAuthor = nullptr;
    QLineEdit* m_metaCopyright = nullptr;

    // Status
    QLabel* m_statusLabel = nullptr;
    QProgressBar* m_fileBar = nullptr;
    QLabel* m_fileText = nullptr;
    QProgressBar* m_totalBar = nullptr;
    QLabel* m_totalText = nullptr;
    QPushButton* m_startBtn = nullptr;
    QPushButton* m_stopBtn = nullptr;

    LogViewerWidget* m_logView = nullptr;
};

#endif // MAINWINDOW_H
