#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "client/transfer_client.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/discovery.hpp"
#include "server/transfer_server.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}

int fail(const airshare::Error& error) {
    QTextStream(stderr) << airshare::error_code_name(error.code) << ": "
                        << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

// Serve until Ctrl+C.
int runServer(QCoreApplication& app,
              airshare::server::ServerConfig config,
              const airshare::Settings& settings) {
    airshare::server::TransferServer server(
        std::move(config),
        airshare::network::createDiscoveryBackend(settings.discovery_backend),
        settings.lookup_timeout);

    auto started = server.start();
    if (started.is_err()) {
        return fail(started.unwrap_err());
    }

    QTextStream(stdout) << airshare::server::startup_banner(server.config(), started.unwrap())
                        << ", press Ctrl+C to stop sharing...\n";

    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
    QTimer interruptPoll;
    interruptPoll.setInterval(200);
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&]() {
        if (g_interrupted.load()) {
            QCoreApplication::quit();
        }
    });
    interruptPoll.start();

    const int rc = app.exec();
    server.stop();
    return rc;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("airshare"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Share text and files on the local network by name.\n\n"
        "  airshare <code>                 fetch what <code> is sharing\n"
        "  airshare <code> <path>...       share files or directories\n"
        "  airshare <code> -t <text>       share text\n"
        "  airshare <code> -u <path>...    upload to the receiver <code>\n"
        "  airshare <code> -r [dir]        receive uploads into dir"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption textOption(
        QStringList{QStringLiteral("t"), QStringLiteral("text")},
        QStringLiteral("Share this text instead of files."),
        QStringLiteral("text"));
    parser.addOption(textOption);

    const QCommandLineOption uploadOption(
        QStringList{QStringLiteral("u"), QStringLiteral("upload")},
        QStringLiteral("Upload the given paths to an Upload Receiver."));
    parser.addOption(uploadOption);

    const QCommandLineOption receiveOption(
        QStringList{QStringLiteral("r"), QStringLiteral("receive")},
        QStringLiteral("Host an Upload Receiver writing into the given directory (default: current)."));
    parser.addOption(receiveOption);

    const QCommandLineOption compressOption(
        QStringList{QStringLiteral("c"), QStringLiteral("compress")},
        QStringLiteral("Zip the content even when a single file is given."));
    parser.addOption(compressOption);

    const QCommandLineOption decompressOption(
        QStringList{QStringLiteral("decompress")},
        QStringLiteral("Extract received .zip uploads and remove the archive."));
    parser.addOption(decompressOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Port to serve on (default 80)."),
        QStringLiteral("port"),
        QStringLiteral("80"));
    parser.addOption(portOption);

    const QCommandLineOption outputOption(
        QStringList{QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Directory fetched files are written to (default: current)."),
        QStringLiteral("dir"));
    parser.addOption(outputOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("timeout")},
        QStringLiteral("Discovery timeout in milliseconds (overrides AIRSHARE_LOOKUP_TIMEOUT_MS)."),
        QStringLiteral("ms"));
    parser.addOption(timeoutOption);

    const QCommandLineOption backendOption(
        QStringList{QStringLiteral("backend")},
        QStringLiteral("Discovery backend: avahi or udp (overrides AIRSHARE_DISCOVERY_BACKEND)."),
        QStringLiteral("name"));
    parser.addOption(backendOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also sets AIRSHARE_DEBUG=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("code"), QStringLiteral("Name of the airshare."));
    parser.addPositionalArgument(QStringLiteral("paths"), QStringLiteral("Files or directories."),
                                 QStringLiteral("[paths...]"));
    parser.process(app);

    if (parser.isSet(debugOption)) {
        qputenv("AIRSHARE_DEBUG", "1");
    }

    auto settings = airshare::settings_from_environment();
    if (parser.isSet(backendOption)) {
        settings.discovery_backend = parser.value(backendOption);
    }
    if (parser.isSet(timeoutOption)) {
        auto timeout = airshare::parse_timeout_ms(parser.value(timeoutOption));
        if (timeout.is_err()) {
            return fail(timeout.unwrap_err());
        }
        settings.lookup_timeout = timeout.unwrap();
    }
    airshare::install_logging(settings.log_file, settings.debug);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const QString code = positional.takeFirst();

    auto port = airshare::parse_port(parser.value(portOption));
    if (port.is_err()) {
        return fail(port.unwrap_err());
    }

    // Upload to a receiver.
    if (parser.isSet(uploadOption)) {
        airshare::network::ServiceRegistry registry(
            airshare::network::createDiscoveryBackend(settings.discovery_backend), settings.lookup_timeout);
        airshare::client::TransferClient client(registry);
        auto sent = client.send(code, positional, parser.isSet(compressOption));
        if (sent.is_err()) {
            return fail(sent.unwrap_err());
        }
        QTextStream(stdout) << "Uploaded `" << sent.unwrap() << "` to airshare `"
                            << airshare::network::instance_host_name(code) << "`!\n";
        return 0;
    }

    // Host an upload receiver.
    if (parser.isSet(receiveOption)) {
        const QString dir = positional.isEmpty() ? QDir::currentPath() : positional.first();
        auto config = airshare::server::ServerConfig::for_upload(code, QDir(dir).absolutePath(), port.unwrap());
        config.decompress = parser.isSet(decompressOption);
        return runServer(app, std::move(config), settings);
    }

    // Share text or files.
    if (parser.isSet(textOption) || !positional.isEmpty()) {
        auto config = airshare::server::make_send_config(
            code, parser.value(textOption), positional, parser.isSet(compressOption), port.unwrap());
        if (config.is_err()) {
            return fail(config.unwrap_err());
        }
        return runServer(app, std::move(config).unwrap(), settings);
    }

    // Fetch.
    airshare::network::ServiceRegistry registry(
        airshare::network::createDiscoveryBackend(settings.discovery_backend), settings.lookup_timeout);
    airshare::client::ClientOptions options;
    options.download_dir = parser.value(outputOption);
    airshare::client::TransferClient client(registry, options);
    auto fetched = client.fetch(code);
    if (fetched.is_err()) {
        return fail(fetched.unwrap_err());
    }
    if (fetched.unwrap().role == airshare::Role::TextSender) {
        QTextStream(stdout) << fetched.unwrap().text << QLatin1Char('\n');
    } else {
        QTextStream(stdout) << "Downloaded `" << fetched.unwrap().saved_path << "` ("
                            << fetched.unwrap().size_bytes << " bytes)\n";
    }
    return 0;
}
