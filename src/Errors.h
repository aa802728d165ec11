#ifndef ERRORS_H
#define ERRORS_H

#include <QString>

#include <stdexcept>

namespace Cloclify
{
    enum ExitCode
    {
        Success = 0,
        UnexpectedFailure = 1,
        UsageFailure = 2,
        ConfigurationFailure = 3,
        ApiFailure = 4,
        NetworkFailure = 5,
    };

    //! Base class of every error that ends an invocation. The message is a single line meant for the user.
    class Error : public std::runtime_error
    {
    public:
        explicit Error(const QString &message);

        virtual ExitCode exitCode() const = 0;
        QString message() const { return QString::fromStdString(what()); }
    };

    //! The command line could not be turned into a command.
    class UsageError : public Error
    {
    public:
        using Error::Error;
        virtual ExitCode exitCode() const final { return UsageFailure; }
    };

    //! Credentials or settings are missing or invalid.
    class ConfigurationError : public Error
    {
    public:
        using Error::Error;
        virtual ExitCode exitCode() const final { return ConfigurationFailure; }
    };

    //! The service answered, but not with a 2xx status or not with usable JSON.
    class ApiError : public Error
    {
    public:
        //! A non-2xx answer. A 401 gets a message pointing at CLOCKIFY_API_KEY.
        static ApiError rejected(const QString &method, const QString &path, int status, const QString &serviceMessage);
        static ApiError malformedResponse(const QString &method, const QString &path, int status, const QString &detail);

        virtual ExitCode exitCode() const final { return ApiFailure; }

        QString method() const { return m_method; }
        QString path() const { return m_path; }
        int status() const { return m_status; }
        bool isAuthenticationFailure() const { return m_status == 401; }

    private:
        ApiError(const QString &method, const QString &path, int status, const QString &message);

        QString m_method;
        QString m_path;
        int m_status;
    };

    //! The request never got an HTTP answer (DNS, refused connection, timeout...).
    class NetworkError : public Error
    {
    public:
        using Error::Error;
        virtual ExitCode exitCode() const final { return NetworkFailure; }
    };
} // namespace Cloclify

#endif // ERRORS_H
