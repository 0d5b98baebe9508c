#include <QCoreApplication>
#include <QTextStream>

#include "client/transfer_client.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/discovery.hpp"

// Resolve a code and print where it lives and which role it plays.
//
//   airshare_lookup <code> [--no-role]
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    QStringList args = app.arguments().mid(1);
    const bool skipRole = args.removeAll(QStringLiteral("--no-role")) > 0;
    if (args.size() != 1) {
        QTextStream(stderr) << "usage: airshare_lookup <code> [--no-role]\n";
        return 2;
    }
    const QString code = args.first();

    const auto settings = airshare::settings_from_environment();
    airshare::install_logging(settings.log_file, settings.debug);

    airshare::network::ServiceRegistry registry(
        airshare::network::createDiscoveryBackend(settings.discovery_backend), settings.lookup_timeout);

    QTextStream out(stdout);
    if (skipRole) {
        auto found = registry.lookup(code);
        if (found.is_err()) {
            QTextStream(stderr) << QString::fromStdString(found.unwrap_err().message) << '\n';
            return 1;
        }
        if (!found.unwrap()) {
            out << code << ": not found\n";
            return 3;
        }
        const auto& record = *found.unwrap();
        out << airshare::network::qualified_instance_name(record.name) << " -> "
            << record.address.toString() << ':' << record.port << '\n';
        return 0;
    }

    airshare::client::TransferClient client(registry);
    auto target = client.identify(code);
    if (target.is_err()) {
        const auto& error = target.unwrap_err();
        QTextStream(stderr) << airshare::error_code_name(error.code) << ": "
                            << QString::fromStdString(error.message) << '\n';
        return error.code == airshare::ErrorCode::ServiceNotFound ? 3 : 1;
    }

    const auto& request = target.unwrap();
    out << airshare::network::qualified_instance_name(request.name) << " -> "
        << request.address.toString() << ':' << request.port << " ("
        << QString::fromUtf8(airshare::role_identifier(request.expected_role).data()) << ")\n";
    return 0;
}
