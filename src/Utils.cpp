#include "Utils.h"

#include <QLocale>
#include <QRegularExpression>
#include <QTextBoundaryFinder>

namespace
{
    const QString timePattern{QStringLiteral(R"((\d\d?:\d\d?|/|now))")};

    // East Asian wide and fullwidth blocks plus the emoji planes, all taking two terminal cells
    bool isWide(char32_t c)
    {
        return (c >= 0x1100 && c <= 0x115F) || (c >= 0x2E80 && c <= 0x303E) || (c >= 0x3041 && c <= 0x33FF)
            || (c >= 0x3400 && c <= 0x4DBF) || (c >= 0x4E00 && c <= 0x9FFF) || (c >= 0xA000 && c <= 0xA4CF)
            || (c >= 0xAC00 && c <= 0xD7A3) || (c >= 0xF900 && c <= 0xFAFF) || (c >= 0xFE30 && c <= 0xFE4F)
            || (c >= 0xFF00 && c <= 0xFF60) || (c >= 0xFFE0 && c <= 0xFFE6) || (c >= 0x1F300 && c <= 0x1F64F)
            || (c >= 0x1F900 && c <= 0x1F9FF) || (c >= 0x1FA70 && c <= 0x1FAFF) || (c >= 0x20000 && c <= 0x3FFFD);
    }
} // namespace

std::tuple<qint64, int, int> Cloclify::msecsToHoursMinutesSeconds(qint64 msecs)
{
    qint64 h = msecs / 1000 / 60 / 60;
    msecs -= h * 1000 * 60 * 60;
    int m = static_cast<int>(msecs / 1000 / 60);
    msecs -= m * 1000 * 60;
    int s = static_cast<int>(msecs / 1000);

    return {h, m, s};
}

qsizetype Cloclify::displayWidth(const QString &text)
{
    qsizetype width{0};
    QTextBoundaryFinder graphemes{QTextBoundaryFinder::Grapheme, text};

    qsizetype start{0};
    for (auto end = graphemes.toNextBoundary(); end != -1; end = graphemes.toNextBoundary())
    {
        const auto cluster = QStringView{text}.mid(start, end - start);
        start = end;

        const char32_t first = cluster.size() > 1 && cluster[0].isHighSurrogate()
                                   ? QChar::surrogateToUcs4(cluster[0], cluster[1])
                                   : cluster[0].unicode();
        switch (QChar::category(first))
        {
        case QChar::Mark_NonSpacing:
        case QChar::Mark_Enclosing:
        case QChar::Other_Format:
        case QChar::Other_Control:
            continue;
        default:
            break;
        }

        // U+FE0F asks for the emoji presentation of the character before it
        width += isWide(first) || cluster.contains(QChar{0xFE0F}) ? 2 : 1;
    }

    return width;
}

std::optional<Cloclify::TimeToken> Cloclify::parseTimeToken(const QString &text)
{
    if (text == QStringLiteral("now"))
        return TimeToken{TimeToken::Kind::Now, {}};
    if (text == QStringLiteral("/"))
        return TimeToken{TimeToken::Kind::Open, {}};

    static const QRegularExpression clock{QStringLiteral(R"(^(\d\d?):(\d\d?)$)")};
    auto match = clock.match(text);
    if (!match.hasMatch())
        return std::nullopt;

    QTime time{match.captured(1).toInt(), match.captured(2).toInt()};
    if (!time.isValid())
        return std::nullopt;

    return TimeToken{TimeToken::Kind::Clock, time};
}

bool Cloclify::looksLikeTimespan(const QString &text)
{
    static const QRegularExpression timespan{QRegularExpression::anchoredPattern(timePattern + '-' + timePattern)};
    return timespan.match(text).hasMatch();
}

std::optional<std::pair<Cloclify::TimeToken, Cloclify::TimeToken>> Cloclify::parseTimespan(const QString &text)
{
    auto parts = text.split('-');
    if (parts.size() != 2)
        return std::nullopt;

    auto start = parseTimeToken(parts[0]);
    auto end = parseTimeToken(parts[1]);
    if (!start || !end)
        return std::nullopt;

    return std::pair{*start, *end};
}

std::optional<QDate> Cloclify::parseDate(const QString &text, const QDate &today)
{
    const auto input = text.simplified().toLower();

    if (input == QStringLiteral("today"))
        return today;
    if (input == QStringLiteral("yesterday"))
        return today.addDays(-1);
    if (input == QStringLiteral("tomorrow"))
        return today.addDays(1);

    static const QRegularExpression ago{QStringLiteral(R"(^(\d+) (day|days|week|weeks) ago$)")};
    if (auto match = ago.match(input); match.hasMatch())
    {
        bool ok{false};
        qint64 count = match.captured(1).toInt(&ok);
        if (!ok)
            return std::nullopt;
        if (match.captured(2).startsWith(QStringLiteral("week")))
            count *= 7;

        auto date = today.addDays(-count);
        if (!date.isValid())
            return std::nullopt;
        return date;
    }

    const QLocale c{QLocale::C};
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day)
    {
        if (input == c.dayName(day, QLocale::LongFormat).toLower() || input == c.dayName(day, QLocale::ShortFormat).toLower())
            return today.addDays(-((today.dayOfWeek() - day + 7) % 7));
    }

    if (auto date = QDate::fromString(input, Qt::ISODate); date.isValid())
        return date;

    return std::nullopt;
}

std::optional<QDate> Cloclify::parseMonth(const QString &text)
{
    static const QRegularExpression month{QStringLiteral(R"(^(\d{4})-(\d\d?)$)")};
    auto match = month.match(text.trimmed());
    if (!match.hasMatch())
        return std::nullopt;

    QDate first{match.captured(1).toInt(), match.captured(2).toInt(), 1};
    if (!first.isValid())
        return std::nullopt;

    return first;
}
