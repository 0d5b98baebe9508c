#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(airshareServerLog, "airshare.server", QtInfoMsg)
Q_LOGGING_CATEGORY(airshareDiscoveryLog, "airshare.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(airshareClientLog, "airshare.client", QtInfoMsg)
Q_LOGGING_CATEGORY(airshareContentLog, "airshare.content", QtInfoMsg)

namespace airshare {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

void install_logging(const QString& log_file, bool debug) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.path = log_file;
        if (!log_file.isEmpty()) {
            QDir().mkpath(QFileInfo(log_file).absolutePath());
            s.file.setFileName(log_file);
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "airshare: cannot open log file %s\n",
                             qUtf8Printable(log_file));
            }
        }
    }

    if (debug) {
        QLoggingCategory::setFilterRules(QStringLiteral("airshare.*.debug=true\n"));
    }
    qInstallMessageHandler(message_handler);
}

QString current_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.path;
}

} // namespace airshare
