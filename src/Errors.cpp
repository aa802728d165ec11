#include "Errors.h"

namespace
{
    QString apiErrorMessage(const QString &method, const QString &path, int status, const QString &serviceMessage)
    {
        if (status == 401)
            return QStringLiteral("Authentication failed: Clockify rejected the API key (%1 %2 returned 401). "
                                  "Check that CLOCKIFY_API_KEY holds a valid key.")
                .arg(method, path);

        auto text = QStringLiteral("API %1 to %2 failed with %3").arg(method, path, QString::number(status));
        if (!serviceMessage.isEmpty())
            text += QStringLiteral(": ") + serviceMessage;
        return text;
    }
} // namespace

Cloclify::Error::Error(const QString &message)
    : std::runtime_error{message.toStdString()}
{}

Cloclify::ApiError::ApiError(const QString &method, const QString &path, int status, const QString &message)
    : Error{message},
      m_method{method},
      m_path{path},
      m_status{status}
{}

Cloclify::ApiError Cloclify::ApiError::rejected(const QString &method,
                                                const QString &path,
                                                int status,
                                                const QString &serviceMessage)
{
    return ApiError{method, path, status, apiErrorMessage(method, path, status, serviceMessage)};
}

Cloclify::ApiError Cloclify::ApiError::malformedResponse(const QString &method,
                                                         const QString &path,
                                                         int status,
                                                         const QString &detail)
{
    return ApiError{method,
                    path,
                    status,
                    QStringLiteral("API %1 to %2 returned an unreadable response: %3").arg(method, path, detail)};
}
