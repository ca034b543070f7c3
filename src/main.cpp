#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include "AppConstants.h"
#include "ReplayConfig.h"
#include "ReplaySession.h"
#include "PlaybackController.h"
#include "Logging.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser cli;
    cli.setApplicationDescription("Replays a recorded GPS track in sync with a 360 video");
    cli.addHelpOption();
    cli.addVersionOption();
    cli.addPositionalArgument("config", "Replay configuration file (JSON)");
    QCommandLineOption trackOption("track", "Track CSV, used when no configuration is given", "file");
    QCommandLineOption videoOption("video", "Video file", "file");
    QCommandLineOption offsetOption("offset", "Video to GPS offset in ms", "ms", "0");
    QCommandLineOption seekOption("seek", "Start position in seconds from the timeline start", "sec");
    cli.addOption(trackOption);
    cli.addOption(videoOption);
    cli.addOption(offsetOption);
    cli.addOption(seekOption);
    cli.process(app);

    QTextStream err(stderr);
    ReplayOptions options;
    const QStringList args = cli.positionalArguments();
    if (!args.isEmpty()) {
        ReplayConfig config;
        if (!config.load(args.first(), options)) {
            err << config.errorString() << "\n";
            return 1;
        }
    } else if (cli.isSet(trackOption)) {
        options.trackFile = cli.value(trackOption);
        options.videoFile = cli.value(videoOption);
        options.videoGpsOffsetMs = cli.value(offsetOption).toLongLong();
    } else {
        cli.showHelp(1);
    }

    ReplaySession session;
    if (!session.open(options)) {
        err << session.errorString() << "\n";
        return 1;
    }

    PlaybackController* controller = session.controller();
    QObject::connect(controller, &PlaybackController::stateChanged, &app, [&app](PlaybackState state) {
        if (state == PlaybackState::Completed) app.quit();
    });

    controller->play();

    if (cli.isSet(seekOption)) {
        const qint64 elapsedMs = static_cast<qint64>(cli.value(seekOption).toDouble() * 1000.0);
        const Timeline& timeline = controller->timeline();
        const qint64 target = timeline.elapsedToGpsTime(elapsedMs);
        controller->seekTo(target, timeline.gpsTimeToVideoTime(target), true);
    }

    return app.exec();
}
