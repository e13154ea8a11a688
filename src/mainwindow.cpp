#include "mainwindow.h"
#include "converter_backend.h"
#include "log_viewer_widget.h"
#include "queue_model.h"
#include "ui/file_type_helpers.h"

#include <QApplication>
#include <QCloseEvent>
#include <QColorDialog>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QFrame>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QMessageBox>
#include <QMimeData>
#include <QScrollArea>
#include <QSettings>
#include <QSplitter>
#include <QTimer>
#include <QUrl>
#include <QVBoxLayout>

namespace {

struct UpscaleTarget {
    const char* label;
    int width;
    int height;
};

const UpscaleTarget kUpscaleTargets[] = {
    {"360p", 640, 360},
    {"480p", 854, 480},
    {"540p", 960, 540},
    {"720p", 1280, 720},
    {"900p", 1600, 900},
    {"1080p", 1920, 1080},
    {"1440p", 2560, 1440},
    {"4K", 3840, 2160},
    {"8K", 7680, 4320},
    {"16K", 15360, 8640},
};

void fillChoices(QComboBox* combo, const QVector<ConversionOptions::Choice>& choices)
{
    for (const auto& c : choices) {
        combo->addItem(QCoreApplication::translate("ConversionOptions", c.second), c.first);
    }
}

void selectData(QComboBox* combo, const QString& id)
{
    const int idx = combo->findData(id);
    combo->setCurrentIndex(idx >= 0 ? idx : 0);
}

void selectText(QComboBox* combo, const QString& text)
{
    const int idx = combo->findText(text);
    combo->setCurrentIndex(idx >= 0 ? idx : 0);
}

QString sizeText(int v) { return v > 0 ? QString::number(v) : QString(); }
QString secondsText(double v) { return v >= 0.0 ? QString::number(v, 'g', 10) : QString(); }

QFrame* makeCard(QWidget* parent)
{
    QFrame* card = new QFrame(parent);
    card->setObjectName("card");
    return card;
}

QWidget* withButton(QLineEdit* edit, QPushButton* button, QWidget* parent)
{
    QWidget* w = new QWidget(parent);
    QHBoxLayout* h = new QHBoxLayout(w);
    h->setContentsMargins(0, 0, 0, 0);
    h->addWidget(edit, 1);
    h->addWidget(button);
    return w;
}

QSpinBox* makeSpin(int min, int max, int value, QWidget* parent, const QString& suffix = QString())
{
    QSpinBox* s = new QSpinBox(parent);
    s->setRange(min, max);
    s->setValue(value);
    if (!suffix.isEmpty()) s->setSuffix(suffix);
    return s;
}

} // namespace

MainWindow::MainWindow(ConverterBackend* backend, const ThemeManager& theme, QWidget *parent)
    : QMainWindow(parent)
    , m_backend(backend)
    , m_theme(theme)
{
    setWindowTitle(tr("Media Converter"));
    setAcceptDrops(true);
    resize(1280, 860);

    QWidget* central = new QWidget(this);
    QVBoxLayout* root = new QVBoxLayout(central);
    root->setContentsMargins(12, 12, 12, 12);
    root->setSpacing(10);
    root->addWidget(buildHeader());

    QTabWidget* tabs = new QTabWidget(central);
    tabs->addTab(buildBasicPage(), tr("Basic"));
    tabs->addTab(buildEditPage(), tr("Edit"));
    tabs->addTab(buildCodecPage(), tr("Codec"));
    tabs->addTab(buildPresetsPage(), tr("Presets"));
    tabs->addTab(buildEnhancePage(), tr("Enhance"));
    tabs->addTab(buildMetadataPage(), tr("Metadata"));

    QWidget* right = new QWidget(central);
    QVBoxLayout* rightLayout = new QVBoxLayout(right);
    rightLayout->setContentsMargins(0, 0, 0, 0);
    rightLayout->addWidget(tabs, 1);
    rightLayout->addWidget(buildStatusCard());

    QSplitter* top = new QSplitter(Qt::Horizontal, central);
    top->addWidget(buildQueuePanel());
    top->addWidget(right);
    top->setStretchFactor(0, 2);
    top->setStretchFactor(1, 3);

    m_logView = new LogViewerWidget(central);
    QSplitter* vertical = new QSplitter(Qt::Vertical, central);
    vertical->addWidget(top);
    vertical->addWidget(m_logView);
    vertical->setStretchFactor(0, 4);
    vertical->setStretchFactor(1, 1);
    root->addWidget(vertical, 1);
    setCentralWidget(central);

    connect(m_backend, &ConverterBackend::ffmpegPathChanged, this, [this]() {
        if (m_ffmpegEdit->text() != m_backend->ffmpegPath()) m_ffmpegEdit->setText(m_backend->ffmpegPath());
    });
    connect(m_backend, &ConverterBackend::outputDirChanged, this, [this]() {
        if (m_outDirEdit->text() != m_backend->outputDir()) m_outDirEdit->setText(m_backend->outputDir());
    });
    connect(m_backend, &ConverterBackend::encodersChanged, this, &MainWindow::refreshEncoderInfo);
    connect(m_backend, &ConverterBackend::runningChanged, this, &MainWindow::refreshRunning);
    connect(m_backend, &ConverterBackend::statusTextChanged, this, [this]() { m_statusLabel->setText(m_backend->statusText()); });
    connect(m_backend, &ConverterBackend::progressChanged, this, &MainWindow::refreshProgress);
    connect(m_backend, &ConverterBackend::mediaInfoChanged, this, &MainWindow::refreshMediaInfo);
    connect(m_backend, &ConverterBackend::presetsChanged, this, &MainWindow::refreshPresets);

    m_statusLabel->setText(m_backend->statusText());
    refreshEncoderInfo();
    refreshRunning();
    refreshProgress();
    refreshMediaInfo();
    refreshPresets();
    applyTheme();

    QSettings s;
    if (s.contains("Ui/Geometry")) restoreGeometry(s.value("Ui/Geometry").toByteArray());
    const QString lastPreset = s.value("Ui/LastPreset").toString();
    if (!lastPreset.isEmpty() && m_backend->presets().contains(lastPreset)) {
        applyFormMap(m_backend->presets().preset(lastPreset));
        m_presetName->setText(lastPreset);
    }

    // Encoder detection runs ffmpeg; let the window show first
    QTimer::singleShot(0, m_backend, &ConverterBackend::refreshEncoders);
}

MainWindow::~MainWindow() = default;

QWidget* MainWindow::buildHeader()
{
    QFrame* card = makeCard(this);
    QGridLayout* g = new QGridLayout(card);
    g->setContentsMargins(12, 10, 12, 10);

    QLabel* title = new QLabel(tr("Media Converter"), card);
    title->setObjectName("title");
    g->addWidget(title, 0, 0, 1, 2);

    m_themeCombo = new QComboBox(card);
    m_themeCombo->addItem(tr("Light"), ThemeManager::modeToString(ThemeManager::Mode::Light));
    m_themeCombo->addItem(tr("Dark"), ThemeManager::modeToString(ThemeManager::Mode::Dark));
    m_themeCombo->addItem(tr("Custom"), ThemeManager::modeToString(ThemeManager::Mode::Custom));
    selectData(m_themeCombo, m_theme.modeName());
    connect(m_themeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onThemeChanged);

    m_langCombo = new QComboBox(card);
    m_langCombo->addItem(tr("System"), "system");
    m_langCombo->addItem("English", "en");
    m_langCombo->addItem(QString::fromUtf8("Українська"), "uk");
    selectData(m_langCombo, QSettings().value("Ui/Language", "system").toString());
    connect(m_langCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onLanguageChanged);

    QHBoxLayout* prefs = new QHBoxLayout();
    prefs->addStretch();
    prefs->addWidget(new QLabel(tr("Theme:"), card));
    prefs->addWidget(m_themeCombo);
    prefs->addWidget(new QLabel(tr("Language:"), card));
    prefs->addWidget(m_langCombo);
    g->addLayout(prefs, 0, 2, 1, 2);

    m_ffmpegEdit = new QLineEdit(m_backend->ffmpegPath(), card);
    m_ffmpegEdit->setPlaceholderText(tr("Path to ffmpeg"));
    QPushButton* browse = new QPushButton(tr("Browse..."), card);
    QPushButton* check = new QPushButton(tr("Check"), card);
    connect(browse, &QPushButton::clicked, this, &MainWindow::onBrowseFfmpeg);
    connect(check, &QPushButton::clicked, this, &MainWindow::onCheckFfmpeg);
    m_encoderLabel = new QLabel(card);
    m_encoderLabel->setObjectName("muted");

    g->addWidget(new QLabel(tr("FFmpeg:"), card), 1, 0);
    g->addWidget(m_ffmpegEdit, 1, 1);
    g->addWidget(browse, 1, 2);
    g->addWidget(check, 1, 3);
    g->addWidget(m_encoderLabel, 2, 1, 1, 3);
    g->setColumnStretch(1, 1);
    return card;
}

QWidget* MainWindow::buildQueuePanel()
{
    QFrame* card = makeCard(this);
    QVBoxLayout* v = new QVBoxLayout(card);

    QLabel* title = new QLabel(tr("Queue"), card);
    title->setObjectName("title");
    QLabel* hint = new QLabel(tr("Drop files or folders here"), card);
    hint->setObjectName("muted");
    v->addWidget(title);
    v->addWidget(hint);

    QHBoxLayout* buttons = new QHBoxLayout();
    m_addFilesBtn = new QPushButton(tr("Add files"), card);
    m_addFolderBtn = new QPushButton(tr("Add folder"), card);
    m_removeBtn = new QPushButton(tr("Remove"), card);
    m_clearBtn = new QPushButton(tr("Clear"), card);
    m_clearBtn->setObjectName("danger");
    connect(m_addFilesBtn, &QPushButton::clicked, this, &MainWindow::onAddFiles);
    connect(m_addFolderBtn, &QPushButton::clicked, this, &MainWindow::onAddFolder);
    connect(m_removeBtn, &QPushButton::clicked, this, &MainWindow::onRemoveSelected);
    connect(m_clearBtn, &QPushButton::clicked, this, &MainWindow::onClearQueue);
    buttons->addWidget(m_addFilesBtn);
    buttons->addWidget(m_addFolderBtn);
    buttons->addWidget(m_removeBtn);
    buttons->addWidget(m_clearBtn);
    v->addLayout(buttons);

    m_queueView = new QListView(card);
    m_queueView->setModel(m_backend->queue());
    m_queueView->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_queueView->setAlternatingRowColors(true);
    connect(m_queueView->selectionModel(), &QItemSelectionModel::currentChanged, this,
            [this](const QModelIndex& current, const QModelIndex&) { onQueueCurrentChanged(current); });
    v->addWidget(m_queueView, 1);

    QGroupBox* info = new QGroupBox(tr("Media info"), card);
    QFormLayout* f = new QFormLayout(info);
    m_infoName = new QLabel(info);
    m_infoName->setWordWrap(true);
    m_infoDuration = new QLabel(info);
    m_infoCodec = new QLabel(info);
    m_infoRes = new QLabel(info);
    m_infoSize = new QLabel(info);
    m_infoContainer = new QLabel(info);
    f->addRow(tr("File:"), m_infoName);
    f->addRow(tr("Duration:"), m_infoDuration);
    f->addRow(tr("Codecs:"), m_infoCodec);
    f->addRow(tr("Resolution:"), m_infoRes);
    f->addRow(tr("Size:"), m_infoSize);
    f->addRow(tr("Container:"), m_infoContainer);
    v->addWidget(info);

    QGroupBox* out = new QGroupBox(tr("Output folder"), card);
    QHBoxLayout* oh = new QHBoxLayout(out);
    m_outDirEdit = new QLineEdit(m_backend->outputDir(), out);
    connect(m_outDirEdit, &QLineEdit::editingFinished, this, [this]() { m_backend->setOutputDir(m_outDirEdit->text()); });
    QPushButton* browse = new QPushButton(tr("Browse..."), out);
    QPushButton* open = new QPushButton(tr("Open"), out);
    connect(browse, &QPushButton::clicked, this, &MainWindow::onBrowseOutputDir);
    connect(open, &QPushButton::clicked, this, [this]() {
        m_backend->setOutputDir(m_outDirEdit->text());
        m_backend->openOutputDir();
    });
    oh->addWidget(m_outDirEdit, 1);
    oh->addWidget(browse);
    oh->addWidget(open);
    v->addWidget(out);
    return card;
}

QWidget* MainWindow::buildBasicPage()
{
    QWidget* page = new QWidget(this);
    QFormLayout* f = new QFormLayout(page);

    m_videoFmt = new QComboBox(page);
    m_videoFmt->addItems(outputVideoFormats());
    m_imageFmt = new QComboBox(page);
    m_imageFmt->addItems(outputImageFormats());
    m_crf = makeSpin(0, 63, 23, page);
    m_crf->setToolTip(tr("Lower is better quality and a bigger file"));
    m_encPreset = new QComboBox(page);
    m_encPreset->addItems(ConversionOptions::encoderPresets());
    m_portrait = new QComboBox(page);
    fillChoices(m_portrait, ConversionOptions::portraitChoices());
    m_imgQuality = makeSpin(1, 100, 90, page);
    m_overwrite = new QCheckBox(tr("Overwrite existing files"), page);
    m_fastCopy = new QCheckBox(tr("Fast copy (no re-encode when possible)"), page);

    f->addRow(tr("Video format:"), m_videoFmt);
    f->addRow(tr("Photo format:"), m_imageFmt);
    f->addRow(tr("Quality (CRF):"), m_crf);
    f->addRow(tr("Encoder preset:"), m_encPreset);
    f->addRow(tr("Portrait (9:16):"), m_portrait);
    f->addRow(tr("Photo quality:"), m_imgQuality);
    f->addRow(QString(), m_overwrite);
    f->addRow(QString(), m_fastCopy);

    selectText(m_encPreset, "medium");
    return page;
}

QWidget* MainWindow::buildEditPage()
{
    QScrollArea* scroll = new QScrollArea(this);
    scroll->setWidgetResizable(true);
    scroll->setFrameShape(QFrame::NoFrame);
    QWidget* page = new QWidget(scroll);
    QVBoxLayout* v = new QVBoxLayout(page);

    // Trim and merge
    QGroupBox* trim = new QGroupBox(tr("Trim and merge"), page);
    QFormLayout* tf = new QFormLayout(trim);
    m_trimStart = new QLineEdit(trim);
    m_trimStart->setPlaceholderText(tr("e.g. 00:00:05 or 5"));
    m_trimEnd = new QLineEdit(trim);
    m_trimEnd->setPlaceholderText(tr("e.g. 00:01:30"));
    m_merge = new QCheckBox(tr("Merge all videos into one file"), trim);
    m_mergeName = new QLineEdit("merged", trim);
    tf->addRow(tr("Start:"), m_trimStart);
    tf->addRow(tr("End:"), m_trimEnd);
    tf->addRow(QString(), m_merge);
    tf->addRow(tr("Merged file name:"), m_mergeName);
    v->addWidget(trim);

    // Geometry
    QGroupBox* geo = new QGroupBox(tr("Resize, crop and rotate"), page);
    QGridLayout* gg = new QGridLayout(geo);
    m_resizeW = new QLineEdit(geo); m_resizeW->setPlaceholderText(tr("W"));
    m_resizeH = new QLineEdit(geo); m_resizeH->setPlaceholderText(tr("H"));
    m_cropW = new QLineEdit(geo); m_cropW->setPlaceholderText(tr("W"));
    m_cropH = new QLineEdit(geo); m_cropH->setPlaceholderText(tr("H"));
    m_cropX = new QLineEdit(geo); m_cropX->setPlaceholderText("X");
    m_cropY = new QLineEdit(geo); m_cropY->setPlaceholderText("Y");
    m_rotate = new QComboBox(geo);
    fillChoices(m_rotate, ConversionOptions::rotateChoices());
    m_speed = new QLineEdit("1.0", geo);
    gg->addWidget(new QLabel(tr("Resize:"), geo), 0, 0);
    gg->addWidget(m_resizeW, 0, 1);
    gg->addWidget(m_resizeH, 0, 2);
    gg->addWidget(new QLabel(tr("Crop:"), geo), 1, 0);
    gg->addWidget(m_cropW, 1, 1);
    gg->addWidget(m_cropH, 1, 2);
    gg->addWidget(m_cropX, 1, 3);
    gg->addWidget(m_cropY, 1, 4);
    gg->addWidget(new QLabel(tr("Rotate:"), geo), 2, 0);
    gg->addWidget(m_rotate, 2, 1, 1, 2);
    gg->addWidget(new QLabel(tr("Speed:"), geo), 3, 0);
    gg->addWidget(m_speed, 3, 1);
    v->addWidget(geo);

    // Image watermark
    QGroupBox* wm = new QGroupBox(tr("Image watermark"), page);
    QFormLayout* wf = new QFormLayout(wm);
    m_wmPath = new QLineEdit(wm);
    QPushButton* wmBrowse = new QPushButton(tr("Browse..."), wm);
    connect(wmBrowse, &QPushButton::clicked, this, [this]() {
        pickFile(m_wmPath, tr("Choose watermark"), tr("Images (*.png *.jpg *.jpeg *.webp *.bmp);;All Files (*)"));
    });
    m_wmPos = new QComboBox(wm);
    fillChoices(m_wmPos, ConversionOptions::positionChoices());
    m_wmOpacity = makeSpin(0, 100, 80, wm, "%");
    m_wmScale = makeSpin(1, 100, 30, wm, "%");
    wf->addRow(tr("File:"), withButton(m_wmPath, wmBrowse, wm));
    wf->addRow(tr("Position:"), m_wmPos);
    wf->addRow(tr("Opacity:"), m_wmOpacity);
    wf->addRow(tr("Scale:"), m_wmScale);
    v->addWidget(wm);

    // Text watermark
    QGroupBox* text = new QGroupBox(tr("Text watermark"), page);
    QFormLayout* xf = new QFormLayout(text);
    m_textWm = new QLineEdit(text);
    m_textPos = new QComboBox(text);
    fillChoices(m_textPos, ConversionOptions::positionChoices());
    m_textSize = makeSpin(6, 400, 24, text);
    m_textColor = new QLineEdit("white", text);
    QPushButton* colorBtn = new QPushButton(tr("Pick..."), text);
    connect(colorBtn, &QPushButton::clicked, this, [this]() { pickColor(m_textColor); });
    m_textBox = new QCheckBox(tr("Background box"), text);
    m_textBoxColor = new QLineEdit("black", text);
    QPushButton* boxColorBtn = new QPushButton(tr("Pick..."), text);
    connect(boxColorBtn, &QPushButton::clicked, this, [this]() { pickColor(m_textBoxColor); });
    m_textBoxOpacity = makeSpin(0, 100, 50, text, "%");
    m_textFont = new QLineEdit(text);
    QPushButton* fontBrowse = new QPushButton(tr("Browse..."), text);
    connect(fontBrowse, &QPushButton::clicked, this, [this]() {
        pickFile(m_textFont, tr("Choose font"), tr("Fonts (*.ttf *.otf);;All Files (*)"));
    });
    xf->addRow(tr("Text:"), m_textWm);
    xf->addRow(tr("Position:"), m_textPos);
    xf->addRow(tr("Size:"), m_textSize);
    xf->addRow(tr("Color:"), withButton(m_textColor, colorBtn, text));
    xf->addRow(QString(), m_textBox);
    xf->addRow(tr("Box color:"), withButton(m_textBoxColor, boxColorBtn, text));
    xf->addRow(tr("Box opacity:"), m_textBoxOpacity);
    xf->addRow(tr("Font file:"), withButton(m_textFont, fontBrowse, text));
    v->addWidget(text);

    v->addStretch();
    scroll->setWidget(page);
    return scroll;
}

QWidget* MainWindow::buildCodecPage()
{
    QWidget* page = new QWidget(this);
    QFormLayout* f = new QFormLayout(page);
    m_codec = new QComboBox(page);
    fillChoices(m_codec, ConversionOptions::codecChoices());
    m_hw = new QComboBox(page);
    fillChoices(m_hw, ConversionOptions::hwChoices());
    f->addRow(tr("Video codec:"), m_codec);
    f->addRow(tr("Hardware encoder:"), m_hw);
    QLabel* note = new QLabel(tr("Unavailable encoders fall back to the CPU; see the log for details."), page);
    note->setObjectName("muted");
    note->setWordWrap(true);
    f->addRow(QString(), note);
    return page;
}

QWidget* MainWindow::buildPresetsPage()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* v = new QVBoxLayout(page);
    m_presetList = new QListWidget(page);
    connect(m_presetList, &QListWidget::currentTextChanged, this, [this](const QString& name) {
        if (!name.isEmpty()) m_presetName->setText(name);
    });
    connect(m_presetList, &QListWidget::itemDoubleClicked, this, [this]() { onLoadPreset(); });
    v->addWidget(m_presetList, 1);

    QHBoxLayout* row = new QHBoxLayout();
    m_presetName = new QLineEdit(page);
    m_presetName->setPlaceholderText(tr("Preset name"));
    QPushButton* load = new QPushButton(tr("Load"), page);
    QPushButton* save = new QPushButton(tr("Save"), page);
    QPushButton* del = new QPushButton(tr("Delete"), page);
    del->setObjectName("danger");
    connect(load, &QPushButton::clicked, this, &MainWindow::onLoadPreset);
    connect(save, &QPushButton::clicked, this, &MainWindow::onSavePreset);
    connect(del, &QPushButton::clicked, this, &MainWindow::onDeletePreset);
    row->addWidget(m_presetName, 1);
    row->addWidget(load);
    row->addWidget(save);
    row->addWidget(del);
    v->addLayout(row);
    return page;
}

QWidget* MainWindow::buildEnhancePage()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* v = new QVBoxLayout(page);
    QLabel* hint = new QLabel(tr("Upscale sets the resize width and height. Quality depends on the source."), page);
    hint->setObjectName("muted");
    hint->setWordWrap(true);
    v->addWidget(hint);

    QGridLayout* grid = new QGridLayout();
    int i = 0;
    for (const UpscaleTarget& t : kUpscaleTargets) {
        const QString label = QString::fromLatin1(t.label);
        QPushButton* b = new QPushButton(QString("%1  (%2x%3)").arg(label).arg(t.width).arg(t.height), page);
        const int w = t.width;
        const int h = t.height;
        connect(b, &QPushButton::clicked, this, [this, label, w, h]() { onUpscale(label, w, h); });
        grid->addWidget(b, i / 2, i % 2);
        ++i;
    }
    v->addLayout(grid);

    QPushButton* reset = new QPushButton(tr("Reset size"), page);
    connect(reset, &QPushButton::clicked, this, [this]() {
        m_resizeW->clear();
        m_resizeH->clear();
        m_backend->appendLog("INFO", tr("Resize cleared"));
    });
    v->addWidget(reset);
    v->addStretch();
    return page;
}

QWidget* MainWindow::buildMetadataPage()
{
    QWidget* page = new QWidget(this);
    QFormLayout* f = new QFormLayout(page);
    m_stripMeta = new QCheckBox(tr("Strip all metadata"), page);
    m_copyMeta = new QCheckBox(tr("Copy metadata from the source"), page);
    m_copyMeta->setChecked(true);
    m_metaTitle = new QLineEdit(page);
    m_metaComment = new QLineEdit(page);
    m_metaAuthor = new QLineEdit(page);
    m_metaCopyright = new QLineEdit(page);
    f->addRow(QString(), m_stripMeta);
    f->addRow(QString(), m_copyMeta);
    f->addRow(tr("Title:"), m_metaTitle);
    f->addRow(tr("Comment:"), m_metaComment);
    f->addRow(tr("Author:"), m_metaAuthor);
    f->addRow(tr("Copyright:"), m_metaCopyright);
    return page;
}

QWidget* MainWindow::buildStatusCard()
{
    QFrame* card = makeCard(this);
    QVBoxLayout* v = new QVBoxLayout(card);
    m_statusLabel = new QLabel(card);
    m_statusLabel->setObjectName("title");
    v->addWidget(m_statusLabel);

    m_fileBar = new QProgressBar(card);
    m_fileBar->setRange(0, 100);
    m_fileBar->setTextVisible(false);
    m_fileText = new QLabel(card);
    m_fileText->setObjectName("muted");
    m_totalBar = new QProgressBar(card);
    m_totalBar->setRange(0, 100);
    m_totalBar->setTextVisible(false);
    m_totalText = new QLabel(card);
    m_totalText->setObjectName("muted");
    v->addWidget(m_fileBar);
    v->addWidget(m_fileText);
    v->addWidget(m_totalBar);
    v->addWidget(m_totalText);

    QHBoxLayout* buttons = new QHBoxLayout();
    m_startBtn = new QPushButton(tr("Start"), card);
    m_startBtn->setObjectName("primary");
    m_stopBtn = new QPushButton(tr("Stop"), card);
    m_stopBtn->setObjectName("danger");
    connect(m_startBtn, &QPushButton::clicked, this, &MainWindow::onStart);
    connect(m_stopBtn, &QPushButton::clicked, this, &MainWindow::onStop);
    buttons->addStretch();
    buttons->addWidget(m_startBtn);
    buttons->addWidget(m_stopBtn);
    v->addLayout(buttons);
    return card;
}

QVariantMap MainWindow::collectFormMap() const
{
    QVariantMap m;
    m["out_video_fmt"] = m_videoFmt->currentText();
    m["out_image_fmt"] = m_imageFmt->currentText();
    m["crf"] = m_crf->value();
    m["preset"] = m_encPreset->currentText();
    m["portrait"] = m_portrait->currentData().toString();
    m["img_quality"] = m_imgQuality->value();
    m["overwrite"] = m_overwrite->isChecked();
    m["fast_copy"] = m_fastCopy->isChecked();
    m["trim_start"] = m_trimStart->text().trimmed();
    m["trim_end"] = m_trimEnd->text().trimmed();
    m["merge"] = m_merge->isChecked();
    m["merge_name"] = m_mergeName->text().trimmed();
    m["resize_w"] = m_resizeW->text().trimmed();
    m["resize_h"] = m_resizeH->text().trimmed();
    m["crop_w"] = m_cropW->text().trimmed();
    m["crop_h"] = m_cropH->text().trimmed();
    m["crop_x"] = m_cropX->text().trimmed();
    m["crop_y"] = m_cropY->text().trimmed();
    m["rotate"] = m_rotate->currentData().toString();
    m["speed"] = m_speed->text().trimmed();
    m["wm_path"] = m_wmPath->text().trimmed();
    m["wm_pos"] = m_wmPos->currentData().toString();
    m["wm_opacity"] = m_wmOpacity->value();
    m["wm_scale"] = m_wmScale->value();
    m["text_wm"] = m_textWm->text();
    m["text_pos"] = m_textPos->currentData().toString();
    m["text_size"] = m_textSize->value();
    m["text_color"] = m_textColor->text().trimmed();
    m["text_box"] = m_textBox->isChecked();
    m["text_box_color"] = m_textBoxColor->text().trimmed();
    m["text_box_opacity"] = m_textBoxOpacity->value();
    m["text_font"] = m_textFont->text().trimmed();
    m["codec"] = m_codec->currentData().toString();
    m["hw"] = m_hw->currentData().toString();
    m["strip_metadata"] = m_stripMeta->isChecked();
    m["copy_metadata"] = m_copyMeta->isChecked();
    m["meta_title"] = m_metaTitle->text();
    m["meta_comment"] = m_metaComment->text();
    m["meta_author"] = m_metaAuthor->text();
    m["meta_copyright"] = m_metaCopyright->text();
    return m;
}

void MainWindow::applyFormMap(const QVariantMap& map)
{
    const ConversionSettings s = ConversionSettings::fromPresetMap(map);
    selectText(m_videoFmt, s.outVideoFormat);
    selectText(m_imageFmt, s.outImageFormat);
    m_crf->setValue(s.crf);
    selectText(m_encPreset, s.encoderPreset);
    selectData(m_portrait, s.portrait);
    m_imgQuality->setValue(s.imageQuality);
    m_overwrite->setChecked(s.overwrite);
    m_fastCopy->setChecked(s.fastCopy);
    m_trimStart->setText(secondsText(s.trimStart));
    m_trimEnd->setText(secondsText(s.trimEnd));
    m_merge->setChecked(s.merge);
    m_mergeName->setText(s.mergeName);
    m_resizeW->setText(sizeText(s.resizeWidth));
    m_resizeH->setText(sizeText(s.resizeHeight));
    m_cropW->setText(sizeText(s.cropWidth));
    m_cropH->setText(sizeText(s.cropHeight));
    m_cropX->setText(sizeText(s.cropX));
    m_cropY->setText(sizeText(s.cropY));
    selectData(m_rotate, s.rotate);
    m_speed->setText(QString::number(s.speed, 'g', 6));
    m_wmPath->setText(s.watermarkPath);
    selectData(m_wmPos, s.watermarkPosition);
    m_wmOpacity->setValue(s.watermarkOpacity);
    m_wmScale->setValue(s.watermarkScale);
    m_textWm->setText(s.textWatermark);
    selectData(m_textPos, s.textPosition);
    m_textSize->setValue(s.textSize);
    m_textColor->setText(s.textColor);
    m_textBox->setChecked(s.textBox);
    m_textBoxColor->setText(s.textBoxColor);
    m_textBoxOpacity->setValue(s.textBoxOpacity);
    m_textFont->setText(s.textFont);
    selectData(m_codec, s.videoCodec);
    selectData(m_hw, s.hwEncoder);
    m_stripMeta->setChecked(s.stripMetadata);
    m_copyMeta->setChecked(s.copyMetadata);
    m_metaTitle->setText(s.metaTitle);
    m_metaComment->setText(s.metaComment);
    m_metaAuthor->setText(s.metaAuthor);
    m_metaCopyright->setText(s.metaCopyright);
}

void MainWindow::pickColor(QLineEdit* target)
{
    QColor initial(target->text().trimmed());
    if (!initial.isValid()) initial = Qt::white;
    const QColor c = QColorDialog::getColor(initial, this, tr("Choose color"));
    if (c.isValid()) target->setText(c.name());
}

void MainWindow::pickFile(QLineEdit* target, const QString& title, const QString& filter)
{
    const QString path = QFileDialog::getOpenFileName(this, title, QFileInfo(target->text()).absolutePath(), filter);
    if (!path.isEmpty()) target->setText(path);
}

void MainWindow::onBrowseFfmpeg()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Choose ffmpeg"), QString(), tr("All Files (*)"));
    if (path.isEmpty()) return;
    m_ffmpegEdit->setText(path);
    m_backend->setFfmpegPath(path);
    m_backend->refreshEncoders();
}

void MainWindow::onCheckFfmpeg()
{
    m_backend->setFfmpegPath(m_ffmpegEdit->text());
    m_backend->refreshEncoders();
}

void MainWindow::onBrowseOutputDir()
{
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Choose output folder"), m_outDirEdit->text());
    if (dir.isEmpty()) return;
    m_outDirEdit->setText(dir);
    m_backend->setOutputDir(dir);
}

void MainWindow::onAddFiles()
{
    const QStringList files = QFileDialog::getOpenFileNames(this, tr("Add files"), QString(),
        tr("Media (*.mov *.mp4 *.mkv *.webm *.avi *.m4v *.flv *.wmv *.mts *.m2ts *.jpg *.jpeg *.png *.webp *.bmp *.tif *.tiff *.heic *.heif);;All Files (*)"));
    if (!files.isEmpty()) m_backend->addFiles(files);
}

void MainWindow::onAddFolder()
{
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Add folder"));
    if (!dir.isEmpty()) m_backend->addFolder(dir);
}

void MainWindow::onRemoveSelected()
{
    QList<int> rows;
    for (const QModelIndex& idx : m_queueView->selectionModel()->selectedRows()) rows << idx.row();
    if (rows.isEmpty()) return;
    m_backend->removeRows(rows);
    m_backend->selectQueueIndex(m_queueView->currentIndex().row());
}

void MainWindow::onClearQueue()
{
    m_backend->clearQueue();
}

void MainWindow::onQueueCurrentChanged(const QModelIndex &current)
{
    m_backend->selectQueueIndex(current.isValid() ? current.row() : -1);
}

void MainWindow::onStart()
{
    if (m_backend->isRunning()) return;
    m_backend->setFfmpegPath(m_ffmpegEdit->text());
    m_backend->setOutputDir(m_outDirEdit->text());

    const QVariantMap raw = collectFormMap();
    switch (m_backend->startConversion(ConversionSettings::fromPresetMap(raw))) {
    case ConverterBackend::StartResult::Started:
        for (const QString& w : ConverterBackend::inputWarnings(raw)) m_backend->appendLog("WARN", w);
        break;
    case ConverterBackend::StartResult::FfmpegMissing:
        if (QMessageBox::critical(this, tr("FFmpeg"),
                                  tr("FFmpeg not found. Choose the ffmpeg executable now?"),
                                  QMessageBox::Yes | QMessageBox::No) == QMessageBox::Yes) {
            onBrowseFfmpeg();
        }
        break;
    case ConverterBackend::StartResult::QueueEmpty:
        QMessageBox::information(this, tr("Queue is empty"), tr("Add files to convert."));
        break;
    case ConverterBackend::StartResult::OutputDirFailed:
        QMessageBox::critical(this, tr("Output folder"), tr("Cannot create the output folder."));
        break;
    case ConverterBackend::StartResult::AlreadyRunning:
        break;
    }
}

void MainWindow::onStop()
{
    m_backend->stopConversion();
}

void MainWindow::onSavePreset()
{
    const QString name = m_presetName->text().trimmed();
    if (name.isEmpty()) {
        QMessageBox::warning(this, tr("Presets"), tr("Enter a preset name."));
        return;
    }
    if (m_backend->presetExists(name) &&
        QMessageBox::question(this, tr("Presets"), tr("Preset already exists. Overwrite?")) != QMessageBox::Yes) {
        return;
    }
    if (!m_backend->savePreset(name, collectFormMap())) {
        QMessageBox::warning(this, tr("Presets"), tr("The preset could not be saved. See the log for details."));
        return;
    }
    const QList<QListWidgetItem*> found = m_presetList->findItems(name, Qt::MatchExactly);
    if (!found.isEmpty()) m_presetList->setCurrentItem(found.first());
}

void MainWindow::onLoadPreset()
{
    QListWidgetItem* item = m_presetList->currentItem();
    const QString name = item ? item->text() : m_presetName->text().trimmed();
    if (name.isEmpty()) return;
    const QVariantMap values = m_backend->loadPreset(name);
    if (values.isEmpty()) return;
    applyFormMap(values);
    m_presetName->setText(name);
}

void MainWindow::onDeletePreset()
{
    QListWidgetItem* item = m_presetList->currentItem();
    if (!item) return;
    const QString name = item->text();
    if (QMessageBox::question(this, tr("Presets"), tr("Delete preset '%1'?").arg(name)) != QMessageBox::Yes) return;
    m_backend->deletePreset(name);
}

void MainWindow::onThemeChanged(int index)
{
    const QString modeName = m_themeCombo->itemData(index).toString();
    m_theme.setMode(ThemeManager::modeFromString(modeName));
    QSettings().setValue("Ui/Theme", modeName);
    applyTheme();
}

void MainWindow::onLanguageChanged(int index)
{
    QSettings().setValue("Ui/Language", m_langCombo->itemData(index).toString());
    m_backend->appendLog("INFO", tr("Restart the application to apply the language."));
}

void MainWindow::onUpscale(const QString &label, int width, int height)
{
    m_resizeW->setText(QString::number(width));
    m_resizeH->setText(QString::number(height));
    m_backend->appendLog("INFO", tr("Upscale: %1 (%2x%3)").arg(label).arg(width).arg(height));
}

void MainWindow::applyTheme()
{
    bool fallback = false;
    const ThemeManager::Palette palette = m_theme.palette(&fallback);
    if (auto* app = qobject_cast<QApplication*>(QCoreApplication::instance())) m_theme.apply(*app);
    if (m_logView) m_logView->setThemePalette(palette);
    if (fallback) {
        m_backend->appendLog("WARN", tr("Custom theme not found or invalid: %1").arg(m_theme.customThemeFile()));
    }
}

void MainWindow::refreshEncoderInfo()
{
    const QString info = m_backend->encoderInfo();
    m_encoderLabel->setText(info.isEmpty() ? tr("Encoders not checked yet") : info);
}

void MainWindow::refreshRunning()
{
    const bool running = m_backend->isRunning();
    m_startBtn->setEnabled(!running);
    m_stopBtn->setEnabled(running);
    m_removeBtn->setEnabled(!running);
    m_clearBtn->setEnabled(!running);
}

void MainWindow::refreshProgress()
{
    m_fileBar->setValue(int(m_backend->fileProgress() * 100.0));
    m_totalBar->setValue(int(m_backend->totalProgress() * 100.0));
    m_fileText->setText(m_backend->fileProgressText());
    m_totalText->setText(m_backend->totalProgressText());
}

void MainWindow::refreshMediaInfo()
{
    const QVariantMap info = m_backend->mediaInfo();
    m_infoName->setText(info.value("name").toString());
    m_infoDuration->setText(info.value("duration").toString());
    m_infoCodec->setText(info.value("codec").toString());
    m_infoRes->setText(info.value("resolution").toString());
    m_infoSize->setText(info.value("size").toString());
    m_infoContainer->setText(info.value("container").toString());
}

void MainWindow::refreshPresets()
{
    const QString current = m_presetList->currentItem() ? m_presetList->currentItem()->text() : QString();
    m_presetList->clear();
    m_presetList->addItems(m_backend->presetNames());
    const QList<QListWidgetItem*> found = m_presetList->findItems(current, Qt::MatchExactly);
    if (!current.isEmpty() && !found.isEmpty()) m_presetList->setCurrentItem(found.first());
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_backend->isRunning()) {
        if (QMessageBox::question(this, tr("Media Converter"),
                                  tr("A conversion is running. Stop it and quit?")) != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        m_backend->stopConversion();
    }
    QSettings().setValue("Ui/Geometry", saveGeometry());
    event->accept();
}

void MainWindow::dragEnterEvent(QDragEnterEvent *event)
{
    if (event->mimeData()->hasUrls() && !m_backend->isRunning()) event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent *event)
{
    m_backend->addUrls(event->mimeData()->urls());
    event->acceptProposedAction();
}
