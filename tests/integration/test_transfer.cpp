#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "client/transfer_client.hpp"
#include "content/share_session.hpp"
#include "content/zip_archive.hpp"
#include "server/session_host.hpp"
#include "support/memory_discovery.hpp"
#include "support/test_env.hpp"

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <functional>
#include <vector>

using namespace airshare;
using namespace airshare::server;
using airshare::testing::MemoryDirectory;

namespace {

// One directory of discovery records, one host to run sessions, one client.
struct Lan {
    std::shared_ptr<MemoryDirectory> directory = std::make_shared<MemoryDirectory>();
    SessionHost host = testing::memory_session_host(directory);
    std::unique_ptr<network::ServiceRegistry> registry = testing::memory_registry(directory);
    QTemporaryDir scratch;

    std::unique_ptr<SessionHandle> serve(ServerConfig config) {
        auto started = host.start(testing::local_config(std::move(config)));
        if (started.is_err()) {
            FAIL("session did not start: " << started.unwrap_err().message);
        }
        return std::move(started).unwrap();
    }

    client::TransferClient client(const QString& download_dir = {}) {
        client::ClientOptions options;
        options.transfer_timeout = std::chrono::milliseconds{10000};
        options.download_dir = download_dir;
        return client::TransferClient(*registry, options);
    }

    QString path(const QString& name) const { return scratch.filePath(name); }
};

// Keep the calling thread's event loop running until `done` or the deadline.
bool spin_until(const std::function<bool()>& done, std::chrono::milliseconds limit = std::chrono::milliseconds{5000}) {
    QDeadlineTimer deadline(limit);
    while (!done() && !deadline.hasExpired()) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return done();
}

QUrl local_url(uint16_t port, const QString& path) {
    return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(port).arg(path));
}

// GETs issued together and awaited on one local event loop.
QList<QByteArray> get_all(const QList<QUrl>& urls) {
    QNetworkAccessManager network;
    network.setProxy(QNetworkProxy::NoProxy);

    std::vector<std::unique_ptr<QNetworkReply>> replies;
    for (const auto& url : urls) {
        replies.emplace_back(network.get(QNetworkRequest(url)));
    }

    QEventLoop loop;
    int pending = static_cast<int>(replies.size());
    for (auto& reply : replies) {
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, [&loop, &pending] {
            if (--pending == 0) {
                loop.quit();
            }
        });
    }
    if (pending > 0) {
        loop.exec();
    }

    QList<QByteArray> bodies;
    for (auto& reply : replies) {
        REQUIRE(reply->error() == QNetworkReply::NoError);
        bodies << reply->readAll();
    }
    return bodies;
}

} // namespace

TEST_CASE("text is fetched as sent", "[transfer][integration]") {
    Lan lan;
    const QString text = QStringLiteral("déjà vu ✓\nsecond line");
    auto session = lan.serve(ServerConfig::for_session(QStringLiteral("note"), content::ShareSession::from_text(text)));

    auto client = lan.client();
    auto fetched = client.fetch(QStringLiteral("note"));
    REQUIRE(fetched.is_ok());
    CHECK(fetched.unwrap().role == Role::TextSender);
    CHECK(fetched.unwrap().text == text);

    auto raw = testing::raw_http(session->port(), "GET / HTTP/1.1\r\nHost: note.local\r\n\r\n");
    CHECK(raw.status == 200);
    CHECK(raw.header("content-type").startsWith("text/plain"));
    CHECK(raw.header("connection") == "close");
    CHECK(raw.body == text.toUtf8());
}

TEST_CASE("downloads are byte-exact across chunk boundaries", "[transfer][integration]") {
    const qsizetype size = GENERATE(as<qsizetype>{}, 0, 1, 8191, 8192, 8193, 3 * 8192 + 5, 1024 * 1024 + 3);
    CAPTURE(size);

    Lan lan;
    const auto source = lan.path(QStringLiteral("payload.bin"));
    const QByteArray bytes = testing::pattern_bytes(size, static_cast<uint32_t>(size) + 7);
    testing::write_file(source, bytes);

    auto shared = content::ShareSession::from_file(source, QStringLiteral("payload.bin"));
    REQUIRE(shared.is_ok());
    auto session = lan.serve(ServerConfig::for_session(QStringLiteral("blob"), std::move(shared).unwrap()));

    const auto downloads = lan.path(QStringLiteral("downloads"));
    auto client = lan.client(downloads);
    auto fetched = client.fetch(QStringLiteral("blob"));
    REQUIRE(fetched.is_ok());
    CHECK(fetched.unwrap().role == Role::FileSender);
    CHECK(fetched.unwrap().size_bytes == static_cast<quint64>(size));
    CHECK(QFileInfo(fetched.unwrap().saved_path).fileName() == QStringLiteral("payload.bin"));
    CHECK(testing::read_file(fetched.unwrap().saved_path) == bytes);
}

TEST_CASE("the download response names and sizes the file", "[transfer][integration]") {
    Lan lan;
    const auto source = lan.path(QStringLiteral("report.txt"));
    testing::write_file(source, "plain report\n");
    auto shared = content::ShareSession::from_file(source, QStringLiteral("report.txt"));
    REQUIRE(shared.is_ok());
    auto session = lan.serve(ServerConfig::for_session(QStringLiteral("report"), std::move(shared).unwrap()));

    auto page = testing::raw_http(session->port(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(page.status == 200);
    CHECK(page.header("content-type").startsWith("text/html"));
    CHECK(page.body.contains("action=\"/download\""));
    CHECK(page.body.contains("Download report.txt ("));

    auto download = testing::raw_http(session->port(), "GET /download HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(download.status == 200);
    CHECK(download.header("content-length") == "13");
    CHECK(download.header("content-type").startsWith("text/plain"));
    CHECK(client::disposition_file_name(download.header("content-disposition")) == QStringLiteral("report.txt"));
    CHECK(download.body == "plain report\n");
}

TEST_CASE("shared directories are served as an archive", "[transfer][integration]") {
    Lan lan;
    QDir(lan.scratch.path()).mkpath(QStringLiteral("album/inner"));
    testing::write_file(lan.path(QStringLiteral("album/a.txt")), "alpha");
    testing::write_file(lan.path(QStringLiteral("album/inner/b.txt")), "beta");

    auto config = make_send_config(QStringLiteral("album"), QString(), {lan.path(QStringLiteral("album"))}, false);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().role == Role::FileSender);
    auto session = lan.serve(std::move(config).unwrap());

    auto client = lan.client(lan.path(QStringLiteral("downloads")));
    auto fetched = client.fetch(QStringLiteral("album"));
    REQUIRE(fetched.is_ok());
    REQUIRE(QFileInfo(fetched.unwrap().saved_path).fileName() == QStringLiteral("album.zip"));

    const QString archive = fetched.unwrap().saved_path;
    auto entries = content::read_zip_entries(archive);
    REQUIRE(entries.is_ok());
    REQUIRE(entries.unwrap().size() == 2);

    QHash<QString, QByteArray> members;
    for (const auto& entry : entries.unwrap()) {
        auto bytes = content::read_zip_entry_bytes(archive, entry);
        REQUIRE(bytes.is_ok());
        members.insert(entry.name, bytes.unwrap());
    }
    CHECK(members.value(QStringLiteral("album/a.txt")) == "alpha");
    CHECK(members.value(QStringLiteral("album/inner/b.txt")) == "beta");
}

TEST_CASE("uploads land in the receiver's directory", "[transfer][integration]") {
    Lan lan;
    const auto inbox = lan.path(QStringLiteral("inbox"));
    auto receiver = lan.serve(ServerConfig::for_upload(QStringLiteral("drop"), inbox));

    const auto source = lan.path(QStringLiteral("photo.jpg"));
    const QByteArray bytes = testing::pattern_bytes(200 * 1024 + 11, 42);
    testing::write_file(source, bytes);

    auto client = lan.client();
    auto sent = client.send(QStringLiteral("drop"), {source});
    REQUIRE(sent.is_ok());
    CHECK(sent.unwrap() == QStringLiteral("photo.jpg"));
    CHECK(testing::read_file(QDir(inbox).filePath(QStringLiteral("photo.jpg"))) == bytes);
}

TEST_CASE("several uploaded files arrive as one archive", "[transfer][integration]") {
    Lan lan;
    const auto inbox = lan.path(QStringLiteral("inbox"));

    auto decompress = GENERATE(false, true);
    CAPTURE(decompress);

    auto config = ServerConfig::for_upload(QStringLiteral("bundle"), inbox);
    config.decompress = decompress;
    auto receiver = lan.serve(std::move(config));

    testing::write_file(lan.path(QStringLiteral("one.txt")), "one");
    testing::write_file(lan.path(QStringLiteral("two.txt")), "two");

    auto client = lan.client();
    auto sent = client.send(QStringLiteral("bundle"),
                            {lan.path(QStringLiteral("one.txt")), lan.path(QStringLiteral("two.txt"))});
    REQUIRE(sent.is_ok());
    CHECK(sent.unwrap() == QStringLiteral("airshare.zip"));

    const QDir dir(inbox);
    if (decompress) {
        CHECK_FALSE(dir.exists(QStringLiteral("airshare.zip")));
        CHECK(testing::read_file(dir.filePath(QStringLiteral("one.txt"))) == "one");
        CHECK(testing::read_file(dir.filePath(QStringLiteral("two.txt"))) == "two");
    } else {
        auto entries = content::read_zip_entries(dir.filePath(QStringLiteral("airshare.zip")));
        REQUIRE(entries.is_ok());
        CHECK(entries.unwrap().size() == 2);
    }
}

TEST_CASE("roles are checked before anything moves", "[transfer][integration]") {
    Lan lan;
    const auto source = lan.path(QStringLiteral("doc.txt"));
    testing::write_file(source, "doc");
    auto shared = content::ShareSession::from_file(source, QStringLiteral("doc.txt"));
    REQUIRE(shared.is_ok());
    auto sender = lan.serve(ServerConfig::for_session(QStringLiteral("sender"), std::move(shared).unwrap()));
    auto receiver = lan.serve(ServerConfig::for_upload(QStringLiteral("receiver"), lan.path(QStringLiteral("in"))));

    auto client = lan.client(lan.path(QStringLiteral("out")));

    SECTION("uploading to a sender") {
        auto sent = client.send(QStringLiteral("sender"), {source});
        REQUIRE(sent.is_err());
        CHECK(sent.unwrap_err().code == ErrorCode::RoleMismatch);
        CHECK(sent.unwrap_err().message.find("is not an upload receiver") != std::string::npos);
    }

    SECTION("fetching from a receiver") {
        auto fetched = client.fetch(QStringLiteral("receiver"));
        REQUIRE(fetched.is_err());
        CHECK(fetched.unwrap_err().code == ErrorCode::RoleMismatch);
        CHECK_FALSE(QDir(lan.path(QStringLiteral("out"))).exists());
    }
}

TEST_CASE("invalid input never reaches discovery", "[transfer]") {
    Lan lan;
    auto client = lan.client();

    auto empty = client.send(QStringLiteral("anyone"), {});
    REQUIRE(empty.is_err());
    CHECK(empty.unwrap_err().code == ErrorCode::InvalidInput);

    auto missing = client.send(QStringLiteral("anyone"), {lan.path(QStringLiteral("nope.bin"))});
    REQUIRE(missing.is_err());
    CHECK(missing.unwrap_err().code == ErrorCode::InvalidInput);

    auto nothing = make_send_config(QStringLiteral("anyone"), QString(), {}, false);
    REQUIRE(nothing.is_err());
    CHECK(nothing.unwrap_err().code == ErrorCode::InvalidInput);

    CHECK(lan.directory->resolve_calls == 0);
}

TEST_CASE("unknown names are reported as not found", "[transfer]") {
    Lan lan;
    auto client = lan.client();

    auto fetched = client.fetch(QStringLiteral("ghost"));
    REQUIRE(fetched.is_err());
    CHECK(fetched.unwrap_err().code == ErrorCode::ServiceNotFound);
    CHECK(fetched.unwrap_err().message == "The airshare `ghost.local` does not exist!");

    testing::write_file(lan.path(QStringLiteral("f.txt")), "f");
    auto sent = client.send(QStringLiteral("ghost"), {lan.path(QStringLiteral("f.txt"))});
    REQUIRE(sent.is_err());
    CHECK(sent.unwrap_err().code == ErrorCode::ServiceNotFound);
}

TEST_CASE("requests outside the role contract are rejected", "[transfer][integration]") {
    Lan lan;
    auto text = lan.serve(ServerConfig::for_session(QStringLiteral("words"),
                                                    content::ShareSession::from_text(QStringLiteral("hello"))));
    auto receiver = lan.serve(ServerConfig::for_upload(QStringLiteral("box"), lan.path(QStringLiteral("box"))));

    CHECK(testing::raw_http(text->port(), "GET /download HTTP/1.1\r\nHost: x\r\n\r\n").status == 404);
    CHECK(testing::raw_http(text->port(), "GET /upload HTTP/1.1\r\nHost: x\r\n\r\n").status == 404);
    CHECK(testing::raw_http(text->port(), "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n").status == 405);
    CHECK(testing::raw_http(receiver->port(), "GET /upload HTTP/1.1\r\nHost: x\r\n\r\n").status == 405);
    CHECK(testing::raw_http(receiver->port(), "POST /upload HTTP/1.1\r\nHost: x\r\n\r\n").status == 411);
    CHECK(testing::raw_http(receiver->port(),
                            "POST /upload HTTP/1.1\r\nHost: x\r\nContent-Type: text/plain\r\nContent-Length: 3\r\n\r\nabc")
              .status == 400);

    const QByteArray no_file =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"comment\"\r\n"
        "\r\n"
        "hi\r\n"
        "--b--\r\n";
    auto missing = testing::raw_http(receiver->port(),
                                     "POST /upload HTTP/1.1\r\nHost: x\r\n"
                                     "Content-Type: multipart/form-data; boundary=b\r\n"
                                     "Content-Length: " + QByteArray::number(no_file.size()) + "\r\n\r\n" + no_file);
    CHECK(missing.status == 400);
    CHECK(missing.body.contains("upload_file"));

    auto page = testing::raw_http(receiver->port(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(page.status == 200);
    CHECK(page.body.contains("name=\"upload_file\""));
}

TEST_CASE("concurrent downloads are each byte-exact", "[transfer][integration]") {
    Lan lan;
    const auto source = lan.path(QStringLiteral("large.bin"));
    const QByteArray bytes = testing::pattern_bytes(4 * 1024 * 1024 + 17, 99);
    testing::write_file(source, bytes);

    auto shared = content::ShareSession::from_file(source, QStringLiteral("large.bin"));
    REQUIRE(shared.is_ok());
    auto session = lan.serve(ServerConfig::for_session(QStringLiteral("large"), std::move(shared).unwrap()));

    const QUrl url = local_url(session->port(), QStringLiteral("/download"));
    const auto bodies = get_all({url, url});
    REQUIRE(bodies.size() == 2);
    CHECK(bodies[0] == bytes);
    CHECK(bodies[1] == bytes);
}

TEST_CASE("serving content announces the requesting peer", "[transfer][integration]") {
    auto directory = std::make_shared<MemoryDirectory>();
    QTemporaryDir scratch;
    const auto source = scratch.filePath(QStringLiteral("notes.txt"));
    testing::write_file(source, "some notes");
    auto shared = content::ShareSession::from_file(source, QStringLiteral("notes.txt"));
    REQUIRE(shared.is_ok());

    auto [code, session, path] = GENERATE(
        table<QString, int, QString>({{QStringLiteral("words"), 0, QStringLiteral("/")},
                                      {QStringLiteral("notes"), 1, QStringLiteral("/")},
                                      {QStringLiteral("notes"), 1, QStringLiteral("/download")}}));
    CAPTURE(code, path);

    auto config = testing::local_config(
        session == 0 ? ServerConfig::for_session(code, content::ShareSession::from_text(QStringLiteral("hello")))
                     : ServerConfig::for_session(code, shared.unwrap()));
    TransferServer server(std::move(config), std::make_unique<testing::MemoryDiscoveryBackend>(directory),
                          std::chrono::milliseconds{50});
    auto started = server.start();
    REQUIRE(started.is_ok());

    QList<QHostAddress> peers;
    QObject::connect(&server, &TransferServer::contentRequested,
                     [&peers](const QHostAddress& peer) { peers << peer; });

    const auto bodies = get_all({local_url(started.unwrap().port, path)});
    REQUIRE_FALSE(bodies.front().isEmpty());

    REQUIRE(spin_until([&peers] { return !peers.isEmpty(); }));
    CHECK(peers.size() == 1);
    CHECK(peers.front().isEqual(QHostAddress(QHostAddress::LocalHost), QHostAddress::ConvertV4MappedToIPv4));
    server.stop();
}

TEST_CASE("a peer that is not an airshare service is a role mismatch", "[transfer][integration]") {
    Lan lan;

    // Any HTTP service answering the role route with an error.
    QTcpServer stranger;
    REQUIRE(stranger.listen(QHostAddress::LocalHost, 0));
    QObject::connect(&stranger, &QTcpServer::newConnection, [&stranger] {
        while (QTcpSocket* socket = stranger.nextPendingConnection()) {
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [socket] {
                socket->readAll();
                socket->write("HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\n"
                              "Content-Length: 9\r\nConnection: close\r\n\r\nNot Found");
                socket->disconnectFromHost();
            });
            QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    });
    {
        std::lock_guard<std::mutex> lock(lan.directory->mu);
        lan.directory->records.insert(QStringLiteral("stranger"),
                                      ServiceRecord{QStringLiteral("stranger"),
                                                    QHostAddress(QHostAddress::LocalHost), stranger.serverPort()});
    }

    testing::write_file(lan.path(QStringLiteral("f.txt")), "f");
    auto client = lan.client(lan.path(QStringLiteral("out")));

    auto sent = client.send(QStringLiteral("stranger"), {lan.path(QStringLiteral("f.txt"))});
    REQUIRE(sent.is_err());
    CHECK(sent.unwrap_err().code == ErrorCode::RoleMismatch);
    CHECK(sent.unwrap_err().message == "The airshare `stranger.local` is not an airshare service!");

    auto fetched = client.fetch(QStringLiteral("stranger"));
    REQUIRE(fetched.is_err());
    CHECK(fetched.unwrap_err().code == ErrorCode::RoleMismatch);

    SECTION("nobody listening is still a network failure") {
        const uint16_t closed = testing::free_port();
        {
            std::lock_guard<std::mutex> lock(lan.directory->mu);
            lan.directory->records.insert(QStringLiteral("gone"),
                                          ServiceRecord{QStringLiteral("gone"),
                                                        QHostAddress(QHostAddress::LocalHost), closed});
        }
        auto unreachable = client.fetch(QStringLiteral("gone"));
        REQUIRE(unreachable.is_err());
        CHECK(unreachable.unwrap_err().code == ErrorCode::Network);
    }
}

TEST_CASE("a shared file that changed size is not served", "[transfer][integration]") {
    Lan lan;
    const auto source = lan.path(QStringLiteral("draft.txt"));
    testing::write_file(source, "first draft");
    auto shared = content::ShareSession::from_file(source, QStringLiteral("draft.txt"));
    REQUIRE(shared.is_ok());
    auto session = lan.serve(ServerConfig::for_session(QStringLiteral("draft"), std::move(shared).unwrap()));

    testing::write_file(source, "a much longer second draft");

    auto download = testing::raw_http(session->port(), "GET /download HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(download.status == 500);
    CHECK(download.body.contains("changed size"));
}
