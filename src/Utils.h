#ifndef UTILS_H
#define UTILS_H

#include <QDate>
#include <QString>
#include <QTime>

#include <optional>
#include <tuple>
#include <utility>

namespace Cloclify
{
    std::tuple<qint64, int, int> msecsToHoursMinutesSeconds(qint64 msecs);

    //! Number of terminal cells @p text takes: wide and emoji characters count twice, combining marks not at all.
    qsizetype displayWidth(const QString &text);

    //! A time of day as typed on the command line: "HH:MM", "now", or "/" for an open end.
    struct TimeToken
    {
        enum class Kind
        {
            Clock,
            Now,
            Open,
        };

        Kind kind;
        QTime time;
    };

    std::optional<TimeToken> parseTimeToken(const QString &text);
    //! Parses "start-end" where either side is a TimeToken, e.g. "9:00-12:30" or "13:00-/".
    std::optional<std::pair<TimeToken, TimeToken>> parseTimespan(const QString &text);
    bool looksLikeTimespan(const QString &text);

    //! Accepts ISO dates, "today", "yesterday", "tomorrow", "N days ago", "N weeks ago" and weekday names. Weekday
    //! names mean the most recent such day, @p today included.
    std::optional<QDate> parseDate(const QString &text, const QDate &today);
    //! Parses "YYYY-MM" and returns the first day of that month.
    std::optional<QDate> parseMonth(const QString &text);
} // namespace Cloclify

#endif // UTILS_H
