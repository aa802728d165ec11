#include "CommandRunner.h"

#include <algorithm>

#include "Errors.h"
#include "Logger.h"

namespace logs = Cloclify::logs;

Cloclify::CommandRunner::CommandRunner(AbstractTimeServiceManager &manager,
                                       const Configuration &config,
                                       const Formatter &formatter,
                                       const QDateTime &now,
                                       QTextStream &out)
    : m_manager{manager},
      m_config{config},
      m_formatter{formatter},
      m_now{now},
      m_out{out}
{
    m_manager.setTransferTimeout(m_config.requestTimeout * 1000);
    m_manager.setPageSize(m_config.pageSize);
}

void Cloclify::CommandRunner::run(const Command &command)
{
    switch (command.type)
    {
    case Command::Type::Help:
    case Command::Type::Version:
        print(command.text.trimmed());
        break;
    case Command::Type::Start:
        start(command);
        break;
    case Command::Type::Stop:
        stop(command);
        break;
    case Command::Type::Add:
        add(command);
        break;
    case Command::Type::List:
        list(command);
        break;
    case Command::Type::Edit:
        edit(command);
        break;
    case Command::Type::Delete:
        remove(command);
        break;
    case Command::Type::Status:
        status();
        break;
    case Command::Type::Dump:
        dump(command);
        break;
    case Command::Type::Projects:
        projects();
        break;
    case Command::Type::Tags:
        tags();
        break;
    case Command::Type::Workspaces:
        workspaces();
        break;
    }
}

void Cloclify::CommandRunner::start(const Command &command)
{
    selectWorkspace();
    auto entry = m_manager.createTimeEntry(newEntry(command, command.start, {}));
    logs::app()->debug("Started time entry {}", entry.id().toStdString());
    m_manager.resolveReferences(entry);
    printDayOf(entry);
}

void Cloclify::CommandRunner::stop(const Command &command)
{
    selectWorkspace();
    auto entry = m_manager.stopRunningTimeEntry(userId(), command.end);
    logs::app()->debug("Stopped time entry {}", entry.id().toStdString());
    m_manager.resolveReferences(entry);
    print(m_formatter.entryLine(entry));
}

void Cloclify::CommandRunner::add(const Command &command)
{
    selectWorkspace();
    auto entry = m_manager.createTimeEntry(newEntry(command, command.start, command.end));
    logs::app()->debug("Added time entry {}", entry.id().toStdString());
    m_manager.resolveReferences(entry);
    printDayOf(entry);
}

void Cloclify::CommandRunner::list(const Command &command)
{
    selectWorkspace();
    auto entries = entriesBetween(command.from, command.to);
    if (entries.isEmpty())
    {
        print(m_formatter.rangeHeader(command.from, command.to));
        print(QStringLiteral("No time entries."));
        return;
    }

    printByDay(entries, false);
    print(m_formatter.totalLine(entries));
}

void Cloclify::CommandRunner::edit(const Command &command)
{
    selectWorkspace();
    auto entry = m_manager.getTimeEntry(command.entryId);

    if (command.descriptionSet)
        entry.setDescription(command.description);
    if (!command.project.isEmpty())
        entry.setProject(projectNamed(command.project));
    if (!command.tags.isEmpty())
        entry.setTags(tagsNamed(command.tags));
    if (command.billable)
        entry.setBillable(*command.billable);

    auto start = entry.start().toLocalTime();
    auto end = entry.running() ? QDateTime{} : entry.end().toLocalTime();

    if (command.editDate)
    {
        const auto days = start.date().daysTo(*command.editDate);
        start = start.addDays(days);
        if (end.isValid())
            end = end.addDays(days);
    }
    if (command.startTime)
        start = QDateTime{start.date(), *command.startTime};
    if (command.endTime)
        end = QDateTime{end.isValid() ? end.date() : start.date(), *command.endTime};

    if (end.isValid() && end <= start)
        throw UsageError{QStringLiteral("The time entry would end at %1, before it starts at %2")
                             .arg(end.toString(QStringLiteral("yyyy-MM-dd HH:mm")),
                                  start.toString(QStringLiteral("yyyy-MM-dd HH:mm")))};

    entry.setStart(start);
    entry.setEnd(end);

    auto updated = m_manager.modifyTimeEntry(entry);
    logs::app()->debug("Modified time entry {}", updated.id().toStdString());
    m_manager.resolveReferences(updated);
    print(m_formatter.entryLine(updated));
}

void Cloclify::CommandRunner::remove(const Command &command)
{
    selectWorkspace();
    m_manager.deleteTimeEntry(command.entryId);
    print(QStringLiteral("Deleted time entry %1").arg(command.entryId));
}

void Cloclify::CommandRunner::status()
{
    selectWorkspace();
    auto running = m_manager.getRunningTimeEntry(userId());
    if (!running)
    {
        print(QStringLiteral("No time entry is running."));
        return;
    }

    m_manager.resolveReferences(*running);
    print(m_formatter.runningLine(*running));
    print(m_formatter.entryLine(*running));
}

void Cloclify::CommandRunner::dump(const Command &command)
{
    selectWorkspace();
    auto entries = entriesBetween(command.from, command.to);
    if (entries.isEmpty())
    {
        print(m_formatter.rangeHeader(command.from, command.to));
        print(QStringLiteral("No time entries."));
        return;
    }

    printByDay(entries, true);
    print(QString{});
    print(m_formatter.totalLine(entries, QStringLiteral("Month total")));
}

void Cloclify::CommandRunner::projects()
{
    selectWorkspace();
    const auto &items = m_manager.projects();
    if (items.isEmpty())
        print(QStringLiteral("No projects."));
    else
        print(m_formatter.projectLines(items));
}

void Cloclify::CommandRunner::tags()
{
    selectWorkspace();
    const auto &items = m_manager.tags();
    if (items.isEmpty())
        print(QStringLiteral("No tags."));
    else
        print(m_formatter.tagLines(items));
}

void Cloclify::CommandRunner::workspaces()
{
    selectWorkspace();
    print(m_formatter.workspaceLines(m_manager.workspaces(), m_manager.workspaceId()));
}

const User &Cloclify::CommandRunner::owner()
{
    if (!m_owner)
    {
        m_owner = m_manager.getApiKeyOwner();
        logs::app()->debug("API key belongs to {} ({})", m_owner->name().toStdString(), m_owner->userId().toStdString());
    }

    return *m_owner;
}

QString Cloclify::CommandRunner::userId()
{
    if (!m_config.userId.isEmpty())
        return m_config.userId;

    return owner().userId();
}

void Cloclify::CommandRunner::selectWorkspace()
{
    if (!m_manager.workspaceId().isEmpty())
        return;

    if (!m_config.workspace.isEmpty())
    {
        const auto &available = m_manager.workspaces();
        auto match = std::find_if(available.cbegin(), available.cend(), [this](const Workspace &w) {
            return w.id() == m_config.workspace || w.name() == m_config.workspace;
        });
        if (match == available.cend())
            match = std::find_if(available.cbegin(), available.cend(), [this](const Workspace &w) {
                return w.name().compare(m_config.workspace, Qt::CaseInsensitive) == 0;
            });
        if (match == available.cend())
            throw ConfigurationError{QStringLiteral("There is no workspace named '%1', run 'cloclify workspaces' to see yours")
                                         .arg(m_config.workspace)};

        logs::app()->debug("Using workspace {} ({})", match->name().toStdString(), match->id().toStdString());
        m_manager.setWorkspaceId(match->id());
        return;
    }

    const auto &user = owner();
    const auto id = user.activeWorkspaceId().isEmpty() ? user.defaultWorkspaceId() : user.activeWorkspaceId();
    if (id.isEmpty())
        throw ConfigurationError{
            QStringLiteral("Could not find out which workspace to use, set CLOCKIFY_WORKSPACE or pass --workspace")};

    logs::app()->debug("Using the active workspace {}", id.toStdString());
    m_manager.setWorkspaceId(id);
}

Project Cloclify::CommandRunner::projectNamed(const QString &name)
{
    auto project = m_manager.projectByName(name);
    if (!project)
        throw UsageError{QStringLiteral("There is no project named '%1', run 'cloclify projects' to see them").arg(name)};

    return *project;
}

QVector<Tag> Cloclify::CommandRunner::tagsNamed(const QStringList &names)
{
    QVector<Tag> found;
    for (const auto &name : names)
    {
        auto tag = m_manager.tagByName(name);
        if (!tag)
            throw UsageError{QStringLiteral("There is no tag named '%1', run 'cloclify tags' to see them").arg(name)};
        if (!found.contains(*tag))
            found.append(*tag);
    }

    return found;
}

TimeEntry Cloclify::CommandRunner::newEntry(const Command &command, const QDateTime &start, const QDateTime &end)
{
    Project project;
    if (!command.project.isEmpty())
        project = projectNamed(command.project);
    else if (!m_config.defaultProject.isEmpty())
    {
        auto defaultProject = m_manager.projectByName(m_config.defaultProject);
        if (!defaultProject)
            throw ConfigurationError{QStringLiteral("The default project '%1' from the settings file does not exist")
                                         .arg(m_config.defaultProject)};
        project = *defaultProject;
    }

    return TimeEntry{QString{},
                     command.description,
                     start,
                     end,
                     project,
                     tagsNamed(command.tags),
                     command.billable.value_or(false)};
}

QVector<TimeEntry> Cloclify::CommandRunner::entriesBetween(const QDate &from, const QDate &to)
{
    const QDateTime start{from, QTime{0, 0}};
    const QDateTime end{to.addDays(1), QTime{0, 0}};

    auto entries = m_manager.getTimeEntries(userId(), start, end);
    for (auto &entry : entries)
        m_manager.resolveReferences(entry);

    return entries;
}

void Cloclify::CommandRunner::printDayOf(const TimeEntry &saved)
{
    const auto day = saved.start().toLocalTime().date();

    QVector<TimeEntry> entries;
    try
    {
        entries = entriesBetween(day, day);
    }
    catch (const Error &e)
    {
        // the entry is saved at this point, so show it on its own
        logs::app()->warn("Could not list the time entries of {}: {}", day.toString(Qt::ISODate).toStdString(), e.what());
        print(m_formatter.entryLine(saved));
        return;
    }

    if (!entries.contains(saved))
        entries.append(saved);

    print(m_formatter.dayHeader(day));
    print(m_formatter.entryLines(entries, {saved.id()}));
    print(m_formatter.totalLine(entries));
}

void Cloclify::CommandRunner::printByDay(const QVector<TimeEntry> &entries, bool dailyTotals)
{
    // one table for everything keeps the columns aligned across days
    const auto lines = m_formatter.entryLines(entries);

    QDate day;
    QVector<TimeEntry> dayEntries;
    for (qsizetype i = 0; i < entries.size(); ++i)
    {
        const auto entryDay = entries[i].start().toLocalTime().date();
        if (entryDay != day)
        {
            if (dailyTotals && !dayEntries.isEmpty())
                print(m_formatter.totalLine(dayEntries));
            if (day.isValid())
                print(QString{});

            print(m_formatter.dayHeader(entryDay));
            day = entryDay;
            dayEntries.clear();
        }

        print(lines[i]);
        dayEntries.append(entries[i]);
    }

    if (dailyTotals && !dayEntries.isEmpty())
        print(m_formatter.totalLine(dayEntries));
}

void Cloclify::CommandRunner::print(const QString &line)
{
    m_out << line << '\n';
}

void Cloclify::CommandRunner::print(const QStringList &lines)
{
    for (const auto &line : lines)
        print(line);
}
