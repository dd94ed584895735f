#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QThread>
#include <QtGlobal>
#include <cstdio>

namespace mindsync::app {
namespace {

constexpr qint64 DEFAULT_MAX_BYTES = 4 * 1024 * 1024;

QString log_file_path() {
    const auto override_path = qEnvironmentVariable("MINDSYNC_LOG_PATH");
    if (!override_path.isEmpty()) {
        return QFileInfo(override_path).absoluteFilePath();
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return base.isEmpty() ? QString{} : QDir(base).filePath(QStringLiteral("logs/mindsync.log"));
}

qint64 max_log_bytes() {
    bool ok = false;
    const auto value = qEnvironmentVariable("MINDSYNC_LOG_MAX_BYTES").toLongLong(&ok);
    return ok && value > 0 ? value : DEFAULT_MAX_BYTES;
}

char level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

class LogSink {
public:
    void configure(bool echo) {
        QMutexLocker lock(&mutex_);
        if (file_.isOpen()) file_.close();
        echo_ = echo;
        failed_ = false;
        path_ = log_file_path();
        max_bytes_ = max_log_bytes();
    }

    void write(QtMsgType type, const QString& line) {
        QMutexLocker lock(&mutex_);
        const auto bytes = line.toUtf8();

        if (open_file()) {
            if (file_.size() + bytes.size() > max_bytes_) rotate();
            if (file_.isOpen()) {
                file_.write(bytes);
                file_.flush();
            }
        }
        if (echo_ || type >= QtWarningMsg) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
        }
    }

private:
    QMutex mutex_;
    QFile file_;
    QString path_;
    qint64 max_bytes_{DEFAULT_MAX_BYTES};
    bool echo_{false};
    bool failed_{false};

    bool open_file() {
        if (file_.isOpen()) return true;
        if (failed_ || path_.isEmpty()) return false;

        QDir().mkpath(QFileInfo(path_).absolutePath());
        file_.setFileName(path_);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            failed_ = true;
            std::fprintf(stderr, "mindsync: cannot open log file %s: %s\n",
                         qPrintable(path_), qPrintable(file_.errorString()));
            return false;
        }
        return true;
    }

    void rotate() {
        file_.close();
        const auto previous = path_ + QStringLiteral(".1");
        QFile::remove(previous);
        if (!QFile::rename(path_, previous)) {
            std::fprintf(stderr, "mindsync: cannot rotate log file %s\n", qPrintable(path_));
        }
        open_file();
    }
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto thread = QThread::currentThread() ? QThread::currentThread()->objectName() : QString{};
    const auto line = QStringLiteral("%1 %2 [%3] %4 %5\n")
                          .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                               QString(QLatin1Char(level_tag(type))),
                               thread.isEmpty() ? QStringLiteral("main") : thread,
                               ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("default"),
                               msg);
    sink().write(type, line);
}

} // namespace

void install_file_logging(bool echo) {
    sink().configure(echo);
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return log_file_path();
}

} // namespace mindsync::app
