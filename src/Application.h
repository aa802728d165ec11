#ifndef APPLICATION_H
#define APPLICATION_H

#include <QDateTime>
#include <QProcessEnvironment>
#include <QStringList>
#include <QTextStream>

namespace Cloclify
{
    //! One invocation: parse the arguments, resolve the configuration and run the command. Every error ends up as a
    //! single "Error: ..." line on @p err and an exit code.
    class Application
    {
    public:
        Application(const QProcessEnvironment &environment, QTextStream &out, QTextStream &err);
        virtual ~Application() = default;

        //! @param arguments The arguments without the program name.
        int exec(const QStringList &arguments);

    protected:
        virtual QDateTime currentDateTime() const { return QDateTime::currentDateTime(); }
        virtual bool outputIsTerminal() const;

    private:
        void run(const QStringList &arguments);
        int fail(const QString &message, int exitCode);

        QProcessEnvironment m_environment;
        QTextStream &m_out;
        QTextStream &m_err;
    };
} // namespace Cloclify

#endif // APPLICATION_H
