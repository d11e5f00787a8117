#include "cli/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(uuidsortCliLog, "uuidsort.cli", QtInfoMsg)

namespace uuidsort::cli {
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
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "uuidsort: cannot open log file %s, logging to stderr\n",
                     qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    } else {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_logging(const QString& log_file_path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = log_file_path;
        s.initialized = false;
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    qInstallMessageHandler(message_handler);
}

QString configured_log_file_path() {
    return qEnvironmentVariable("UUIDSORT_LOG_FILE");
}

bool debug_requested() {
    return qEnvironmentVariableIsSet("UUIDSORT_DEBUG") &&
           qEnvironmentVariable("UUIDSORT_DEBUG") != QStringLiteral("0");
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("uuidsort.*.debug=true\n"));
}

} // namespace uuidsort::cli
