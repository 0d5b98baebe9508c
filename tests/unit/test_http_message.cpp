#include <catch2/catch_test_macros.hpp>

#include "http/http_message.hpp"

using namespace airshare;
using namespace airshare::http;

TEST_CASE("take_request_head parses a complete head and leaves the body", "[http]") {
    QByteArray buffer =
        "POST /upload?x=1 HTTP/1.1\r\n"
        "Host: 192.168.1.5:8000\r\n"
        "Content-Type: multipart/form-data; boundary=abc\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    auto parsed = take_request_head(buffer);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().has_value());

    const auto& request = *parsed.unwrap();
    REQUIRE(request.method == "POST");
    REQUIRE(request.target == "/upload?x=1");
    REQUIRE(request.path == "/upload");
    REQUIRE(request.header("content-type") == QByteArray("multipart/form-data; boundary=abc"));
    REQUIRE(request.content_length() == 5);
    REQUIRE(buffer == "hello");
}

TEST_CASE("take_request_head waits for the blank line", "[http]") {
    QByteArray buffer = "GET / HTTP/1.1\r\nHost: x\r\n";
    auto parsed = take_request_head(buffer);
    REQUIRE(parsed.is_ok());
    REQUIRE_FALSE(parsed.unwrap().has_value());
    REQUIRE(buffer.size() == 25);
}

TEST_CASE("take_request_head rejects malformed heads", "[http]") {
    for (const char* raw : {"GET /\r\n\r\n",
                            "GET / HTTP/2.0\r\n\r\n",
                            "GET nope HTTP/1.1\r\n\r\n",
                            "G@T / HTTP/1.1\r\n\r\n",
                            "GET / HTTP/1.1\r\n folded: yes\r\n\r\n",
                            "GET / HTTP/1.1\r\nno-colon\r\n\r\n",
                            "POST / HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 4\r\n\r\n",
                            "POST / HTTP/1.1\r\nContent-Length: -3\r\n\r\n"}) {
        QByteArray buffer(raw);
        auto parsed = take_request_head(buffer);
        INFO(raw);
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().code == ErrorCode::Protocol);
    }
}

TEST_CASE("header lookup is by lower-case name", "[http]") {
    QByteArray buffer = "GET / HTTP/1.0\r\nX-Thing:  spaced  \r\n\r\n";
    const auto request = *take_request_head(buffer).unwrap();
    REQUIRE(request.header("x-thing") == QByteArray("spaced"));
    REQUIRE_FALSE(request.header("content-length").has_value());
    REQUIRE_FALSE(request.content_length().has_value());
}

TEST_CASE("response heads serialize status line and headers in order", "[http]") {
    HttpResponseHead head;
    head.status = 404;
    head.set("Content-Type", "text/plain").set("Content-Length", "9").set("content-type", "text/html");

    REQUIRE(head.serialize() ==
            "HTTP/1.1 404 Not Found\r\n"
            "Content-Type: text/html\r\n"
            "Content-Length: 9\r\n"
            "\r\n");
}

TEST_CASE("content-disposition for downloads", "[http]") {
    REQUIRE(content_disposition_attachment(QStringLiteral("photos.zip"), 12345) ==
            "attachment; filename=photos.zip; size=12345");
}

TEST_CASE("parse_header_value splits token and parameters", "[http]") {
    const auto value = parse_header_value("form-data; name=\"upload_file\"; filename=\"a \\\"b\\\".txt\"");
    REQUIRE(value.token == "form-data");
    REQUIRE(value.params.value("name") == "upload_file");
    REQUIRE(value.params.value("filename") == "a \"b\".txt");

    const auto bare = parse_header_value("Attachment; filename=x.zip; size=10");
    REQUIRE(bare.token == "attachment");
    REQUIRE(bare.params.value("filename") == "x.zip");
    REQUIRE(bare.params.value("size") == "10");
}

TEST_CASE("safe_file_name keeps only the base name", "[http]") {
    REQUIRE(safe_file_name(QStringLiteral("report.pdf")) == QStringLiteral("report.pdf"));
    REQUIRE(safe_file_name(QStringLiteral("../../etc/passwd")) == QStringLiteral("passwd"));
    REQUIRE(safe_file_name(QStringLiteral("C:\\Users\\me\\x.txt")) == QStringLiteral("x.txt"));
    REQUIRE(safe_file_name(QStringLiteral("..")).isEmpty());
    REQUIRE(safe_file_name(QStringLiteral("dir/")).isEmpty());
}
