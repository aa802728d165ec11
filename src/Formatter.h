#ifndef FORMATTER_H
#define FORMATTER_H

#include <QDateTime>
#include <QStringList>
#include <QVector>

#include <optional>

#include "Project.h"
#include "Tag.h"
#include "TimeEntry.h"
#include "Workspace.h"

namespace Cloclify
{
    enum class ColorMode
    {
        Auto,
        Always,
        Never,
    };

    //! Accepts "auto", "always" and "never".
    std::optional<ColorMode> parseColorMode(const QString &text);

    struct ColorTheme
    {
        bool enabled = true;

        QString description = QStringLiteral("\033[33m"); // yellow
        QString time = QStringLiteral("\033[36m");        // cyan
        QString tag = QStringLiteral("\033[34m");         // blue
        QString running = QStringLiteral("\033[1;32m");   // bold green
        QString dim = QStringLiteral("\033[2m");          // ids and secondary text
        QString header = QStringLiteral("\033[1m");
        QString reset = QStringLiteral("\033[0m");

        QString paint(const QString &code, const QString &text) const;
        //! 24-bit foreground color for "#RRGGBB", empty for anything else.
        static QString rgb(const QString &hexColor);
    };

    //! "H:MM", hours are not wrapped at 24.
    QString formatDuration(qint64 msecs);

    //! Turns records into terminal lines. Timestamps are shown in local time. Nothing here does I/O; "now" is
    //! injected so running entries can be totalled.
    class Formatter
    {
    public:
        Formatter(bool colors, const QDateTime &now);

        //! One aligned line per entry, in the given order. Entries listed in @p markedIds get a leading "*".
        QStringList entryLines(const QVector<TimeEntry> &entries, const QStringList &markedIds = {}) const;
        QString entryLine(const TimeEntry &entry) const;

        QString dayHeader(const QDate &day) const;
        QString rangeHeader(const QDate &from, const QDate &to) const;
        //! "Total: 2:30 (2.50 h)"; running entries count up to now.
        QString totalLine(const QVector<TimeEntry> &entries, const QString &label = QStringLiteral("Total")) const;
        QString runningLine(const TimeEntry &entry) const;

        QStringList projectLines(const QVector<Project> &projects) const;
        QStringList tagLines(const QVector<Tag> &tags) const;
        QStringList workspaceLines(const QVector<Workspace> &workspaces, const QString &activeWorkspaceId) const;

        const ColorTheme &theme() const { return m_theme; }

    private:
        struct Cell
        {
            QString text;
            QString color;
        };
        using Row = QVector<Cell>;

        QStringList table(const QVector<Row> &rows) const;
        Row entryRow(const TimeEntry &entry, bool marked = false) const;

        ColorTheme m_theme;
        QDateTime m_now;
    };
} // namespace Cloclify

#endif // FORMATTER_H
