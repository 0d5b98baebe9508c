#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "http/multipart.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace airshare;
using namespace airshare::http;

namespace {

const QByteArray kBoundary = "ab-ab";

struct Collected {
    std::vector<QByteArray> fields;
    std::vector<QByteArray> bodies;
    int ended = 0;
};

MultipartParser::Callbacks collect_into(Collected& out) {
    return MultipartParser::Callbacks{
        [&out](const PartHeaders& headers) {
            out.fields.push_back(headers.field_name);
            out.bodies.emplace_back();
            return Result<void>::ok();
        },
        [&out](const char* data, qint64 size) {
            out.bodies.back().append(data, size);
            return Result<void>::ok();
        },
        [&out]() {
            ++out.ended;
            return Result<void>::ok();
        },
    };
}

QByteArray form_body(const std::vector<std::string>& contents) {
    QByteArray body = "preamble\r\n";
    for (size_t i = 0; i < contents.size(); ++i) {
        body += "--" + kBoundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"f" + QByteArray::number(static_cast<int>(i)) +
                "\"; filename=\"f.bin\"\r\n\r\n";
        body += QByteArray::fromStdString(contents[i]);
        body += "\r\n";
    }
    body += "--" + kBoundary + "--\r\n";
    return body;
}

// Content drawn from the characters a delimiter is made of.
rc::Gen<std::string> near_boundary_content() {
    return rc::gen::container<std::string>(rc::gen::elementOf(std::string("\r\n-abx\0", 7)));
}

} // namespace

TEST_CASE("Property: multipart parsing does not depend on how bytes are sliced", "[property][multipart]") {
    rc::check("any split of the body yields the same parts",
        []() {
            const auto contents = *rc::gen::container<std::vector<std::string>>(
                *rc::gen::inRange<size_t>(1, 4), near_boundary_content());
            for (const auto& content : contents) {
                RC_PRE(!QByteArray::fromStdString(content).contains("\r\n--" + kBoundary));
            }

            const QByteArray body = form_body(contents);
            auto cuts = *rc::gen::container<std::vector<qsizetype>>(
                rc::gen::inRange<qsizetype>(0, body.size() + 1));
            std::sort(cuts.begin(), cuts.end());

            Collected out;
            MultipartParser parser(kBoundary, collect_into(out));
            qsizetype from = 0;
            for (const auto cut : cuts) {
                RC_ASSERT(parser.feed(body.mid(from, cut - from)).is_ok());
                from = cut;
            }
            RC_ASSERT(parser.feed(body.mid(from)).is_ok());

            RC_ASSERT(parser.finished());
            RC_ASSERT(out.bodies.size() == contents.size());
            RC_ASSERT(out.ended == static_cast<int>(contents.size()));
            for (size_t i = 0; i < contents.size(); ++i) {
                RC_ASSERT(out.fields[i] == "f" + QByteArray::number(static_cast<int>(i)));
                RC_ASSERT(out.bodies[i] == QByteArray::fromStdString(contents[i]));
            }
            return true;
        }
    );
}

TEST_CASE("Property: a body cut short never finishes", "[property][multipart]") {
    rc::check("every strict prefix leaves the parser unfinished",
        []() {
            const auto content = *near_boundary_content();
            RC_PRE(!QByteArray::fromStdString(content).contains("\r\n--" + kBoundary));

            const QByteArray body = form_body({content});
            // The closing "--" after the final delimiter is what finishes a body.
            const qsizetype last = body.lastIndexOf("--\r\n");
            const auto length = *rc::gen::inRange<qsizetype>(0, last + 2);

            Collected out;
            MultipartParser parser(kBoundary, collect_into(out));
            (void)parser.feed(body.left(length));
            RC_ASSERT(!parser.finished());
            return true;
        }
    );
}
