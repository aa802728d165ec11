#include "Formatter.h"

#include <QLocale>
#include <QRegularExpression>

#include "Utils.h"

std::optional<Cloclify::ColorMode> Cloclify::parseColorMode(const QString &text)
{
    const auto mode = text.trimmed().toLower();
    if (mode == QStringLiteral("auto"))
        return ColorMode::Auto;
    if (mode == QStringLiteral("always"))
        return ColorMode::Always;
    if (mode == QStringLiteral("never"))
        return ColorMode::Never;

    return std::nullopt;
}

QString Cloclify::ColorTheme::paint(const QString &code, const QString &text) const
{
    if (!enabled || code.isEmpty() || text.isEmpty())
        return text;

    return code + text + reset;
}

QString Cloclify::ColorTheme::rgb(const QString &hexColor)
{
    static const QRegularExpression hex{QStringLiteral("^#([0-9a-fA-F]{2})([0-9a-fA-F]{2})([0-9a-fA-F]{2})$")};
    auto match = hex.match(hexColor);
    if (!match.hasMatch())
        return {};

    return QStringLiteral("\033[38;2;%1;%2;%3m")
        .arg(match.captured(1).toInt(nullptr, 16))
        .arg(match.captured(2).toInt(nullptr, 16))
        .arg(match.captured(3).toInt(nullptr, 16));
}

QString Cloclify::formatDuration(qint64 msecs)
{
    if (msecs < 0)
        msecs = 0;

    auto [h, m, s] = msecsToHoursMinutesSeconds(msecs);
    Q_UNUSED(s)
    return QStringLiteral("%1:%2").arg(h).arg(m, 2, 10, QChar{'0'});
}

Cloclify::Formatter::Formatter(bool colors, const QDateTime &now)
    : m_now{now}
{
    m_theme.enabled = colors;
}

QStringList Cloclify::Formatter::entryLines(const QVector<TimeEntry> &entries, const QStringList &markedIds) const
{
    QVector<Row> rows;
    rows.reserve(entries.size());
    for (const auto &entry : entries)
        rows.append(entryRow(entry, markedIds.contains(entry.id())));

    return table(rows);
}

QString Cloclify::Formatter::entryLine(const TimeEntry &entry) const
{
    return table(QVector<Row>{entryRow(entry)}).constFirst();
}

QString Cloclify::Formatter::dayHeader(const QDate &day) const
{
    return m_theme.paint(m_theme.header, QLocale::c().toString(day, QStringLiteral("ddd, yyyy-MM-dd")));
}

QString Cloclify::Formatter::rangeHeader(const QDate &from, const QDate &to) const
{
    if (from == to)
        return dayHeader(from);

    const auto c = QLocale::c();
    return m_theme.paint(m_theme.header,
                         QStringLiteral("%1 to %2").arg(c.toString(from, QStringLiteral("ddd, yyyy-MM-dd")),
                                                        c.toString(to, QStringLiteral("ddd, yyyy-MM-dd"))));
}

QString Cloclify::Formatter::totalLine(const QVector<TimeEntry> &entries, const QString &label) const
{
    qint64 total{0};
    for (const auto &entry : entries)
        total += qMax<qint64>(entry.duration(m_now), 0);

    const auto hours = static_cast<double>(total) / (60 * 60 * 1000);
    return QStringLiteral("%1: %2 (%3 h)")
        .arg(m_theme.paint(m_theme.header, label), m_theme.paint(m_theme.time, formatDuration(total)))
        .arg(hours, 0, 'f', 2);
}

QString Cloclify::Formatter::runningLine(const TimeEntry &entry) const
{
    return QStringLiteral("%1 for %2 since %3")
        .arg(m_theme.paint(m_theme.running, QStringLiteral("Running")),
             m_theme.paint(m_theme.time, formatDuration(entry.duration(m_now))),
             m_theme.paint(m_theme.time, entry.start().toLocalTime().toString(QStringLiteral("HH:mm"))));
}

QStringList Cloclify::Formatter::projectLines(const QVector<Project> &projects) const
{
    QVector<Row> rows;
    for (const auto &project : projects)
    {
        Row row{{project.name(), ColorTheme::rgb(project.color())},
                {project.archived() ? QStringLiteral("(archived)") : QString{}, m_theme.dim},
                {project.id(), m_theme.dim}};
        rows.append(row);
    }

    return table(rows);
}

QStringList Cloclify::Formatter::tagLines(const QVector<Tag> &tags) const
{
    QVector<Row> rows;
    for (const auto &tag : tags)
    {
        Row row{{tag.name(), m_theme.tag},
                {tag.archived() ? QStringLiteral("(archived)") : QString{}, m_theme.dim},
                {tag.id(), m_theme.dim}};
        rows.append(row);
    }

    return table(rows);
}

QStringList Cloclify::Formatter::workspaceLines(const QVector<Workspace> &workspaces,
                                                const QString &activeWorkspaceId) const
{
    QVector<Row> rows;
    for (const auto &workspace : workspaces)
    {
        const bool active = workspace.id() == activeWorkspaceId;
        Row row{{active ? QStringLiteral("*") : QString{}, m_theme.running},
                {workspace.name(), active ? m_theme.header : QString{}},
                {workspace.id(), m_theme.dim}};
        rows.append(row);
    }

    return table(rows);
}

Cloclify::Formatter::Row Cloclify::Formatter::entryRow(const TimeEntry &entry, bool marked) const
{
    const auto start = entry.start().toLocalTime();

    Cell end;
    Cell duration;
    if (entry.running())
        end = {QStringLiteral("running"), m_theme.running};
    else
    {
        const auto localEnd = entry.end().toLocalTime();
        auto text = localEnd.toString(QStringLiteral("HH:mm"));
        if (auto days = start.date().daysTo(localEnd.date()); days > 0)
            text += QStringLiteral(" (+%1)").arg(days);

        end = {text, m_theme.time};
        duration = {formatDuration(entry.duration(m_now)), m_theme.time};
    }

    Cell description{entry.description(), m_theme.description};
    if (description.text.trimmed().isEmpty())
        description = {QStringLiteral("(no description)"), m_theme.dim};

    QStringList tagNames;
    for (const auto &tag : entry.tags())
        tagNames.append(tag.name());

    const auto project = entry.project();

    return {{marked ? QStringLiteral("*") : QString{}, m_theme.running},
            {start.toString(QStringLiteral("HH:mm")), m_theme.time},
            {QStringLiteral("-"), QString{}},
            end,
            duration,
            {entry.billable() ? QStringLiteral("$") : QString{}, m_theme.running},
            description,
            {project.isValid() ? project.name() : QString{}, ColorTheme::rgb(project.color())},
            {tagNames.join(QStringLiteral(", ")), m_theme.tag},
            {entry.id(), m_theme.dim}};
}

QStringList Cloclify::Formatter::table(const QVector<Row> &rows) const
{
    qsizetype columns{0};
    for (const auto &row : rows)
        columns = qMax(columns, row.size());

    QVector<qsizetype> widths(columns, 0);
    for (const auto &row : rows)
        for (qsizetype i = 0; i < row.size(); ++i)
            widths[i] = qMax(widths[i], displayWidth(row[i].text));

    // widths are terminal cells; columns that are empty in every row are left out
    QVector<qsizetype> shown;
    for (qsizetype i = 0; i < columns; ++i)
        if (widths[i] > 0)
            shown.append(i);

    QStringList lines;
    lines.reserve(rows.size());
    for (const auto &row : rows)
    {
        QString line;
        for (qsizetype n = 0; n < shown.size(); ++n)
        {
            const auto column = shown[n];
            const auto cell = column < row.size() ? row[column] : Cell{};

            if (n > 0)
                line += QStringLiteral("  ");
            line += m_theme.paint(cell.color, cell.text);
            if (n < shown.size() - 1)
                line += QString{widths[column] - displayWidth(cell.text), QChar{' '}};
        }

        // a trailing column may be empty in this row
        while (line.endsWith(QChar{' '}))
            line.chop(1);

        lines.append(line);
    }

    return lines;
}
