#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

#include <optional>

#include "core/result.hpp"
#include "core/types.hpp"

namespace uuidsort::cli {

enum class Command {
    ToSortable,
    ToStandard,
    Bound,
    Timestamp,
};

struct ConvertOptions {
    // For Timestamp: inputs are in sortable order rather than RFC order.
    bool sortableInput = false;
};

[[nodiscard]] std::optional<Command> parse_command(const QString& name);

// Accepts "<unix-seconds>[.<fraction>]" (fraction up to 9 digits, sign allowed)
// or ISO 8601 "YYYY-MM-DDTHH:MM:SS[.fraction][Z|+hh:mm]".
[[nodiscard]] Result<Instant, QString> parse_instant(const QString& text);

// Converts one trimmed input line. For Bound the line is an instant,
// otherwise a UUID.
[[nodiscard]] Result<QString, QString> convert_line(Command command,
                                                    const QString& line,
                                                    const ConvertOptions& options = {});

// Converts every non-blank input, writing results to `out` and one error
// line per bad input to `err`. Returns the process exit code.
int run_lines(Command command,
              const QStringList& inputs,
              const ConvertOptions& options,
              QTextStream& out,
              QTextStream& err);

} // namespace uuidsort::cli
