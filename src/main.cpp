#include <QApplication>
#include <QDebug>
#include <QLocalServer>
#include <QLocalSocket>
#include <QTimer>
#include "appconfig.h"
#include "databasemanager.h"
#include "dictationapp.h"
#include "logging.h"

int main(int argc, char *argv[])
{
    // The global key listener and xdotool both need X11 (xcb), also under XWayland
    qputenv("QT_QPA_PLATFORM", "xcb");

    // Initialize Qt Application
    QApplication a(argc, argv);
    a.setApplicationName("com.dictly.app");
    a.setOrganizationName("Dictly");
    a.setDesktopFileName("com.dictly.app.desktop");
    a.setQuitOnLastWindowClosed(false);

    bool toggle = false;
    bool reload = false;
    for (int i = 1; i < argc; ++i) {
        const QString arg(argv[i]);
        if (arg == "--toggle") toggle = true;
        else if (arg == "--reload") reload = true;
    }

    // Single Instance Guard
    const QString serverName = "dictly_local_server";
    QLocalSocket socket;
    socket.connectToServer(serverName);
    if (socket.waitForConnected(500)) {
        if (toggle || reload) {
            const QByteArray command = toggle ? "TOGGLE" : "RELOAD";
            qDebug() << "Another instance is running. Sending" << command;
            socket.write(command);
            socket.waitForBytesWritten(1000);
        } else {
            qDebug() << "Another instance is already running.";
        }
        socket.disconnectFromServer();
        return 0; // Exit this instance
    }

    installLogHandler(AppPaths::logPath());

    // 1. Initialize Database
    if (!DatabaseManager::instance().init(AppPaths::databasePath())) {
        return 1;
    }

    // 2. Build the pipeline from the stored settings
    int result = 0;
    {
        DictationApp app(AppConfig::load(DatabaseManager::instance()));
        app.start();

        if (toggle) {
            // Use a small delay to ensure everything is ready
            QTimer::singleShot(100, &app, &DictationApp::toggle);
        }

        // Setup Local Server
        QLocalServer server;
        QObject::connect(&server, &QLocalServer::newConnection, [&]() {
            QLocalSocket *client = server.nextPendingConnection();
            QObject::connect(client, &QLocalSocket::disconnected, client, &QObject::deleteLater);
            QObject::connect(client, &QLocalSocket::readyRead, [&, client]() {
                 QByteArray data = client->readAll();
                 if (data == "TOGGLE") {
                     qDebug() << "Received TOGGLE command.";
                     app.toggle();
                 } else if (data == "RELOAD") {
                     qDebug() << "Received RELOAD command.";
                     app.reloadSettings();
                 }
            });
        });

        if (!server.listen(serverName)) {
            // If listen fails (e.g. stale socket file), try removing it and listening again
            QLocalServer::removeServer(serverName);
            if (!server.listen(serverName)) {
                qCritical() << "Unable to start local server.";
            }
        }

        result = a.exec();
    }

    DatabaseManager::instance().close();
    return result;
}
