#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QLibraryInfo>
#include <QLocale>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QSettings>
#include <QTimer>
#include <QTranslator>
#include <QUrl>

#include "converter_backend.h"
#include "log_manager.h"
#include "mainwindow.h"
#include "theme_manager.h"

namespace {

// "system" resolves through the OS locale; anything without a bundled translation stays English
QString resolveLanguage(const QString& requested)
{
    QString lang = requested.trimmed().toLower();
    if (lang.isEmpty() || lang == "system") lang = QLocale::system().name().section('_', 0, 0);
    return lang;
}

QVariantMap paletteToVariant(const ThemeManager::Palette& palette)
{
    QVariantMap m;
    for (auto it = palette.constBegin(); it != palette.constEnd(); ++it) m.insert(it.key(), it.value());
    return m;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Identify app for QSettings and the standard paths
    QCoreApplication::setOrganizationName("MediaConverter");
    QCoreApplication::setApplicationName("Media Converter");
    QCoreApplication::setApplicationVersion(MEDIA_CONVERTER_VERSION);

    // qDebug and friends end up in media_converter.log as well
    qInstallMessageHandler(customMessageHandler);
    LogManager::instance().addLog("[MAIN] Log file: " + LogManager::instance().logFilePath());

    QCommandLineParser parser;
    parser.setApplicationDescription("Batch video and photo converter driven by ffmpeg");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption qmlOption("qml", "Start the Qt Quick interface instead of the widgets window");
    parser.addOption(qmlOption);
    QCommandLineOption themeOption("theme", "Colour theme (light, dark, custom)", "mode");
    parser.addOption(themeOption);
    QCommandLineOption langOption("lang", "Interface language (system, en, uk)", "code");
    parser.addOption(langOption);
    QCommandLineOption verboseOption("verbose", "Also log DEBUG entries such as full ffmpeg command lines");
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption)) LogManager::instance().setMinimumLevel(LogManager::Level::Debug);

    QSettings settings;

    const QString lang = resolveLanguage(parser.isSet(langOption) ? parser.value(langOption)
                                                                  : settings.value("Ui/Language", "system").toString());
    QTranslator qtTranslator;
    if (qtTranslator.load("qtbase_" + lang, QLibraryInfo::path(QLibraryInfo::TranslationsPath))) {
        app.installTranslator(&qtTranslator);
    }
    QTranslator appTranslator;
    if (lang != "en") {
        if (appTranslator.load(":/i18n/media_converter_" + lang + ".qm")) {
            app.installTranslator(&appTranslator);
            LogManager::instance().addLog("[MAIN] Language: " + lang);
        } else {
            qWarning() << "No translation for language" << lang << "- using English";
        }
    }

    ThemeManager theme(parser.isSet(themeOption) ? parser.value(themeOption)
                                                 : settings.value("Ui/Theme", "light").toString());
    if (theme.hadInvalidMode()) {
        qWarning() << "Unknown theme" << theme.invalidMode() << "- using" << theme.modeName();
    }
    theme.apply(app);

    ConverterBackend backend;
    QObject::connect(&app, &QCoreApplication::aboutToQuit, []{ LogManager::instance().addLog("[MAIN] aboutToQuit"); });

    if (parser.isSet(qmlOption)) {
        LogManager::instance().addLog("[MAIN] Starting QML interface");
        QQmlApplicationEngine engine;
        engine.rootContext()->setContextProperty("backend", &backend);
        engine.rootContext()->setContextProperty("logManager", &LogManager::instance());
        engine.rootContext()->setContextProperty("themePalette", paletteToVariant(theme.palette()));
        engine.load(QUrl(QStringLiteral("qrc:/qml/Main.qml")));
        if (engine.rootObjects().isEmpty()) {
            qCritical() << "Failed to load qrc:/qml/Main.qml";
            return -1;
        }
        QTimer::singleShot(0, &backend, &ConverterBackend::refreshEncoders);
        return app.exec();
    }

    MainWindow mainWindow(&backend, theme);
    mainWindow.show();
    LogManager::instance().addLog("[MAIN] MainWindow shown");

    int rc = app.exec();
    LogManager::instance().addLog(QString("[MAIN] Event loop exited with code %1").arg(rc));
    return rc;
}
