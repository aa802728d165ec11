#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <QDateTime>
#include <QStringList>

#include <optional>

#include "Formatter.h"

namespace Cloclify
{
    //! Options accepted before and after the command name.
    struct GlobalOptions
    {
        bool debug{false};
        QString workspace;
        std::optional<ColorMode> color;
    };

    struct Command
    {
        enum class Type
        {
            Help,
            Version,
            Start,
            Stop,
            Add,
            List,
            Edit,
            Delete,
            Status,
            Dump,
            Projects,
            Tags,
            Workspaces,
        };

        Type type{Type::List};
        GlobalOptions global;

        // Help and Version
        QString text;

        // Start, Add and Edit
        QString description;
        bool descriptionSet{false};
        QString project;
        QStringList tags;
        std::optional<bool> billable;

        // Start, Stop and Add. A null end on Add creates a running entry.
        QDateTime start;
        QDateTime end;

        // Edit and Delete
        QString entryId;

        // Edit: times of day, combined with editDate or the entry's own date
        std::optional<QTime> startTime;
        std::optional<QTime> endTime;
        std::optional<QDate> editDate;

        // List and Dump, both days inclusive
        QDate from;
        QDate to;
    };

    //! Turns the arguments (without the program name) into a Command. @p now is the local time relative dates and
    //! "now" are resolved against. Throws Cloclify::UsageError.
    Command parseCommandLine(const QStringList &arguments, const QDateTime &now);

    QStringList commandNames();
} // namespace Cloclify

#endif // COMMANDLINE_H
