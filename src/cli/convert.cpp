#include "cli/convert.hpp"

#include <QDateTime>
#include <QRegularExpression>

#include "cli/logging.hpp"
#include "core/reordering.hpp"

namespace uuidsort::cli {

namespace {

using TextResult = Result<QString, QString>;

[[nodiscard]] QString describe(const Error& error) {
    return QStringLiteral("%1: %2").arg(QString::fromLatin1(to_string(error.kind)),
                                        QString::fromStdString(error.message));
}

// Right-pads a 1-9 digit fraction to nanoseconds.
[[nodiscard]] int64_t fraction_to_nanos(const QString& digits) {
    if (digits.isEmpty()) return 0;
    return digits.leftJustified(9, QLatin1Char('0')).toLongLong();
}

[[nodiscard]] Result<Instant, QString> parse_epoch_seconds(const QRegularExpressionMatch& m) {
    bool ok = false;
    const auto seconds = m.captured(2).toLongLong(&ok);
    if (!ok) {
        return Result<Instant, QString>::err(
            QStringLiteral("seconds out of range: %1").arg(m.captured(0)));
    }
    const auto nanos = fraction_to_nanos(m.captured(3));
    const int64_t sign = m.captured(1) == QStringLiteral("-") ? -1 : 1;
    return Result<Instant, QString>::ok(Instant(sign * seconds, sign * nanos));
}

[[nodiscard]] Result<Instant, QString> parse_iso(const QRegularExpressionMatch& m) {
    const auto zone = m.captured(3).isEmpty() ? QStringLiteral("Z") : m.captured(3);
    const auto dt = QDateTime::fromString(m.captured(1) + zone, Qt::ISODate);
    if (!dt.isValid()) {
        return Result<Instant, QString>::err(
            QStringLiteral("invalid ISO 8601 timestamp: %1").arg(m.captured(0)));
    }
    return Result<Instant, QString>::ok(
        Instant(dt.toSecsSinceEpoch(), fraction_to_nanos(m.captured(2))));
}

[[nodiscard]] TextResult reorder(Command command, const Uuid& id) {
    auto reordered = command == Command::ToSortable ? to_sortable(id) : to_standard(id);
    return reordered.match(
        [](const Uuid& out) { return TextResult::ok(QString::fromStdString(out.to_string())); },
        [](const Error& e) { return TextResult::err(describe(e)); });
}

[[nodiscard]] TextResult timestamp_of(const Uuid& id, const ConvertOptions& options) {
    auto when = options.sortableInput ? sortable_timestamp(id) : standard_timestamp(id);
    return when.match(
        [](const Instant& t) { return TextResult::ok(QString::fromStdString(t.to_iso_string())); },
        [](const Error& e) { return TextResult::err(describe(e)); });
}

[[nodiscard]] TextResult bound_of(const QString& line) {
    const auto when = parse_instant(line);
    if (when.is_err()) {
        return TextResult::err(when.unwrap_err());
    }
    return lowest_bound(when.unwrap()).match(
        [](const Uuid& out) { return TextResult::ok(QString::fromStdString(out.to_string())); },
        [](const Error& e) { return TextResult::err(describe(e)); });
}

} // namespace

std::optional<Command> parse_command(const QString& name) {
    if (name == QStringLiteral("to-sortable")) return Command::ToSortable;
    if (name == QStringLiteral("to-standard")) return Command::ToStandard;
    if (name == QStringLiteral("bound")) return Command::Bound;
    if (name == QStringLiteral("timestamp")) return Command::Timestamp;
    return std::nullopt;
}

Result<Instant, QString> parse_instant(const QString& text) {
    static const QRegularExpression epochRe(
        QStringLiteral(R"(^([+-]?)(\d{1,18})(?:\.(\d{1,9}))?$)"));
    static const QRegularExpression isoRe(
        QStringLiteral(R"(^(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})(?:\.(\d{1,9}))?(Z|[+-]\d{2}:\d{2})?$)"));

    const auto trimmed = text.trimmed();
    if (const auto m = epochRe.match(trimmed); m.hasMatch()) {
        return parse_epoch_seconds(m);
    }
    if (const auto m = isoRe.match(trimmed); m.hasMatch()) {
        return parse_iso(m);
    }
    return Result<Instant, QString>::err(QStringLiteral("not a timestamp: %1").arg(trimmed));
}

Result<QString, QString> convert_line(Command command,
                                      const QString& line,
                                      const ConvertOptions& options) {
    const auto trimmed = line.trimmed();
    if (command == Command::Bound) {
        return bound_of(trimmed);
    }

    const auto id = Uuid::parse(trimmed.toStdString());
    if (!id) {
        return TextResult::err(QStringLiteral("not a UUID: %1").arg(trimmed));
    }

    if (command == Command::Timestamp) {
        return timestamp_of(*id, options);
    }
    return reorder(command, *id);
}

int run_lines(Command command,
              const QStringList& inputs,
              const ConvertOptions& options,
              QTextStream& out,
              QTextStream& err) {
    int exitCode = 0;
    for (const auto& input : inputs) {
        if (input.trimmed().isEmpty()) {
            continue;
        }

        const auto result = convert_line(command, input, options);
        if (result.is_err()) {
            qCDebug(uuidsortCliLog).noquote() << "rejected input:" << result.unwrap_err();
            err << result.unwrap_err() << QLatin1Char('\n');
            exitCode = 1;
            continue;
        }
        out << result.unwrap() << QLatin1Char('\n');
    }
    out.flush();
    err.flush();
    return exitCode;
}

} // namespace uuidsort::cli
