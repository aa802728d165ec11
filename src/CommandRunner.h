#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QTextStream>

#include <optional>

#include "AbstractTimeServiceManager.h"
#include "CommandLine.h"
#include "Configuration.h"
#include "Formatter.h"

namespace Cloclify
{
    //! Runs one command against a time service and prints the result. Errors propagate to the caller.
    class CommandRunner
    {
    public:
        CommandRunner(AbstractTimeServiceManager &manager,
                      const Configuration &config,
                      const Formatter &formatter,
                      const QDateTime &now,
                      QTextStream &out);

        void run(const Command &command);

    private:
        void start(const Command &command);
        void stop(const Command &command);
        void add(const Command &command);
        void list(const Command &command);
        void edit(const Command &command);
        void remove(const Command &command);
        void status();
        void dump(const Command &command);
        void projects();
        void tags();
        void workspaces();

        const User &owner();
        QString userId();
        //! Picks the configured workspace, or the active one of the API key's owner.
        void selectWorkspace();

        Project projectNamed(const QString &name);
        QVector<Tag> tagsNamed(const QStringList &names);
        //! Fills in description, project, tags and billable for start and add.
        TimeEntry newEntry(const Command &command, const QDateTime &start, const QDateTime &end);

        QVector<TimeEntry> entriesBetween(const QDate &from, const QDate &to);
        void printByDay(const QVector<TimeEntry> &entries, bool dailyTotals);
        //! The whole day of a just saved entry, with that entry marked.
        void printDayOf(const TimeEntry &saved);
        void print(const QString &line);
        void print(const QStringList &lines);

        AbstractTimeServiceManager &m_manager;
        const Configuration &m_config;
        const Formatter &m_formatter;
        QDateTime m_now;
        QTextStream &m_out;

        std::optional<User> m_owner;
    };
} // namespace Cloclify

#endif // COMMANDRUNNER_H
