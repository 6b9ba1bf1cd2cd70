#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <filesystem>

#include "EditorConfig.hpp"
#include "MainWindow.hpp"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("MatcapLab");

    QCommandLineParser parser;
    parser.setApplicationDescription("Interactive matcap light placement editor");
    parser.addHelpOption();
    parser.addPositionalArgument("config", "Editor config file (created on first save).", "[config]");
    parser.process(app);

    const QStringList           args = parser.positionalArguments();
    const std::filesystem::path configPath =
        args.isEmpty() ? std::filesystem::path("matcaplab.cfg") : std::filesystem::path(args.front().toStdString());

    EditorConfig cfg;
    if (QFileInfo::exists(QString::fromStdString(configPath.string())))
    {
        if (!config::loadEditorConfig(configPath, cfg))
            qWarning() << "Using default settings; could not load" << QString::fromStdString(configPath.string());
    }

    // Pointer normalization follows the screen's device pixel ratio.
    cfg.displayRatio = static_cast<float>(app.devicePixelRatio());
    config::sanitize(cfg);

    MainWindow win(cfg, configPath);
    win.show();
    return app.exec();
}
