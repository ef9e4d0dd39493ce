/*
 * SelfieLight - Screen light for video calls
 *
 * Lights up parts of the screen in an adjustable color temperature.
 * Right click a light for the menu, "Close All" quits.
 * License: MIT
 */

#include "contextmenu.h"
#include "controller.h"
#include "layout.h"
#include "overlay.h"
#include "settingsstore.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QScreen>
#include <cstdio>

static QScreen *findScreen(const QString &arg) {
    const auto screens = QGuiApplication::screens();
    if (arg.isEmpty()) return QGuiApplication::primaryScreen();

    // Exact or partial name first, then index
    for (QScreen *s : screens) {
        if (s->name() == arg || s->name().contains(arg, Qt::CaseInsensitive)) return s;
    }
    bool ok;
    int idx = arg.toInt(&ok);
    if (ok && idx >= 0 && idx < screens.size()) return screens[idx];
    return nullptr;
}

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("selfielight"));
    app.setApplicationVersion(QStringLiteral("1.0"));
    // Light surfaces come and go on every style change
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Screen light for video calls.\n"
        "Right click a light for options, choose Close All to quit."));
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption({{QStringLiteral("s"), QStringLiteral("screen")},
        QStringLiteral("Screen name or index (from -l output)"), QStringLiteral("name"), QString()});
    parser.addOption({{QStringLiteral("t"), QStringLiteral("style")},
        QStringLiteral("Start with style: sides, border, top, fullscreen or ring"), QStringLiteral("style"), QString()});
    parser.addOption({QStringLiteral("reset"),
        QStringLiteral("Forget saved settings")});
    parser.addOption({{QStringLiteral("l"), QStringLiteral("list")},
        QStringLiteral("List screens and exit")});

    parser.process(app);

    const auto screens = QGuiApplication::screens();

    if (parser.isSet(QStringLiteral("list"))) {
        fprintf(stdout, "Available screens:\n");
        for (int i = 0; i < screens.size(); ++i) {
            QScreen *s = screens[i];
            QRect work = s->availableGeometry();
            fprintf(stdout, "  %d: %s (%dx%d, usable %dx%d @ %d,%d)\n", i, qPrintable(s->name()),
                    s->size().width(), s->size().height(),
                    work.width(), work.height(), work.x(), work.y());
        }
        return 0;
    }

    Style style = Style::Sides;
    const QString styleArg = parser.value(QStringLiteral("style"));
    if (!styleArg.isEmpty() && !parseStyle(styleArg, &style)) {
        fprintf(stderr, "Unknown style: %s\n", qPrintable(styleArg));
        return 1;
    }

    QScreen *screen = findScreen(parser.value(QStringLiteral("screen")));
    if (!screen) {
        fprintf(stderr, "Screen not found: %s\n", qPrintable(parser.value(QStringLiteral("screen"))));
        fprintf(stderr, "Run with -l to list available screens.\n");
        return 1;
    }

    SettingsStore settings;
    if (parser.isSet(QStringLiteral("reset"))) settings.clear();

    ScreenWorkArea workArea(screen);
    SurfaceRegistry registry;
    OverlayFactory factory(screen);
    Controller controller(factory, registry, settings, workArea);

    if (styleArg.isEmpty()) {
        controller.createBars();
    } else {
        controller.setStyle(style);
    }

    if (controller.surfaces().isEmpty()) {
        fprintf(stderr, "Failed to create light windows on %s\n", qPrintable(screen->name()));
        return 1;
    }

    ContextMenu menu(controller);
    // Queued: the menu must not run inside a surface's own press handler
    QObject::connect(&controller, &Controller::menuRequested, &menu, &ContextMenu::popup,
                     Qt::QueuedConnection);
    QObject::connect(&controller, &Controller::quitRequested, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    fprintf(stdout, "%s light on %s, right click it for options.\n",
            qPrintable(styleName(controller.style())), qPrintable(screen->name()));

    return app.exec();
}
