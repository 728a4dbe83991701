// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#define TRANSLATION_DOMAIN "elixi-shell"

#include "PlacementBootstrapper.h"
#include "PointerEventRouter.h"
#include "ShellController.h"
#include "services/DBusGeometryOwner.h"
#include "../config/settings.h"
#include "../core/logging.h"
#include "../core/windowinteractioncontroller.h"
#include "version.h"

#include <QCommandLineParser>
#include <QFile>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickWindow>

#include <KAboutData>
#include <KLocalizedContext>
#include <KLocalizedString>

using namespace Elixi;

int main(int argc, char* argv[])
{
    // Ensure D-Bus session bus is reachable when launched from CLI (e.g. IDE terminal)
    // where DBUS_SESSION_BUS_ADDRESS may be unset. Use systemd default path.
    if (qEnvironmentVariableIsEmpty("DBUS_SESSION_BUS_ADDRESS")) {
        const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
        if (!runtimeDir.isEmpty()) {
            const QString busPath = runtimeDir + QStringLiteral("/bus");
            if (QFile::exists(busPath)) {
                qputenv("DBUS_SESSION_BUS_ADDRESS", QByteArray("unix:path=" + busPath.toUtf8()));
            }
        }
    }

    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("elixi-shell");

    KAboutData aboutData(QStringLiteral("elixi-shell"), i18n("ELIXI Assistant"), Elixi::VERSION_STRING,
                         i18n("Frameless assistant window"), KAboutLicense::GPL_V3, i18n("(c) 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.elixi.shell"));
    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption serviceOption(QStringList{QStringLiteral("s"), QStringLiteral("service")},
                                     i18n("D-Bus service name of the window host"), QStringLiteral("name"));
    QCommandLineOption noPlacementOption(QStringLiteral("no-placement"),
                                         i18n("Do not move the window to its initial position"));

    parser.addOptions({serviceOption, noPlacementOption});
    parser.process(app);
    aboutData.processCommandLine(&parser);

    Settings settings;
    if (parser.isSet(serviceOption)) {
        settings.setServiceName(parser.value(serviceOption));
    }
    if (parser.isSet(noPlacementOption)) {
        settings.setPlacementEnabled(false);
    }

    DBusGeometryOwner owner(settings.serviceName(), settings.objectPath(), settings.interfaceName(),
                            settings.queryTimeoutMs());
    QObject::connect(&owner, &IGeometryOwner::errorOccurred, &app, [](const QString& error) {
        qCWarning(lcShell) << "Window host:" << error;
    });

    WindowInteractionController interaction(&owner, settings.sizeConstraints());
    PointerEventRouter router(&interaction);
    ShellController shell(&owner, settings.alwaysOnTop());

    // Set up QML engine
    QQmlApplicationEngine engine;

    // Set up i18n for QML (this makes i18n() available in QML)
    KLocalizedContext* localizedContext = new KLocalizedContext(&engine);
    engine.rootContext()->setContextObject(localizedContext);

    engine.rootContext()->setContextProperty(QStringLiteral("shellController"), &shell);
    engine.rootContext()->setContextProperty(QStringLiteral("windowRouter"), &router);
    engine.rootContext()->setContextProperty(QStringLiteral("minimumWindowSize"),
                                             settings.sizeConstraints().minimum);
    engine.rootContext()->setContextProperty(QStringLiteral("maximumWindowSize"),
                                             settings.sizeConstraints().maximum);

    engine.loadFromModule("org.elixi.shell", "ShellWindow");

    if (engine.rootObjects().isEmpty()) {
        qCCritical(lcShell) << "Failed to load ShellWindow.qml";
        return -1;
    }

    auto* window = qobject_cast<QQuickWindow*>(engine.rootObjects().constFirst());
    if (!window) {
        qCCritical(lcShell) << "ShellWindow root object is not a window";
        return -1;
    }

    // Declared items are QObject descendants of the window
    router.attach(window);

    if (settings.placementEnabled()) {
        auto* placement = new PlacementBootstrapper(&owner, settings.placementInset(), &app);
        placement->attach(window);
    } else {
        qCInfo(lcShell) << "Initial placement disabled";
    }

    if (settings.alwaysOnTop()) {
        owner.setAlwaysOnTop(true);
    }

    return app.exec();
}
