#include <QCoreApplication>
#include <QCommandLineParser>
#include <QStringList>
#include <QTextStream>

#include <cstdio>

#include "cli/convert.hpp"
#include "cli/logging.hpp"

namespace {

QStringList read_stdin_lines() {
    QStringList lines;
    QTextStream in(stdin);
    QString line;
    while (in.readLineInto(&line)) {
        lines.append(line);
    }
    return lines;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("uuidsort");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Reorder version 1 UUIDs between RFC 4122 order and sortable big-endian order."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption sortableOption(
        QStringList{QStringLiteral("sortable")},
        QStringLiteral("For 'timestamp': inputs are in sortable order."));
    parser.addOption(sortableOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable uuidsort debug logging (also sets UUIDSORT_DEBUG=1)."));
    parser.addOption(debugOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write log output to a file (sets UUIDSORT_LOG_FILE for this run)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("to-sortable, to-standard, bound or timestamp."));
    parser.addPositionalArgument(QStringLiteral("inputs"),
                                 QStringLiteral("UUIDs (or an instant for 'bound'); read from stdin when absent."),
                                 QStringLiteral("[inputs...]"));
    parser.process(app);

    if (parser.isSet(logFileOption)) {
        qputenv("UUIDSORT_LOG_FILE", parser.value(logFileOption).toUtf8());
    }
    if (parser.isSet(debugOption)) {
        qputenv("UUIDSORT_DEBUG", "1");
    }

    uuidsort::cli::install_logging(uuidsort::cli::configured_log_file_path());
    if (uuidsort::cli::debug_requested()) {
        uuidsort::cli::enable_debug_logging();
        qCDebug(uuidsortCliLog) << "debug logging enabled";
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        qCWarning(uuidsortCliLog) << "no command given";
        parser.showHelp(1);
    }

    const auto command = uuidsort::cli::parse_command(positional.takeFirst());
    if (!command) {
        qCWarning(uuidsortCliLog).noquote() << "unknown command" << parser.positionalArguments().first();
        parser.showHelp(1);
    }

    uuidsort::cli::ConvertOptions options;
    options.sortableInput = parser.isSet(sortableOption);

    const auto inputs = positional.isEmpty() ? read_stdin_lines() : positional;

    QTextStream out(stdout);
    QTextStream err(stderr);
    return uuidsort::cli::run_lines(*command, inputs, options, out, err);
}
