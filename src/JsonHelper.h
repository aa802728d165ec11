#ifndef JSONHELPER_H
#define JSONHELPER_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

using nlohmann::json;

// easy conversion of json <=> Qt types
namespace nlohmann
{
    template<> struct adl_serializer<QString>
    {
        static void to_json(json &j, const QString &opt) { j = opt.toStdString(); }

        static void from_json(const json &j, QString &opt) { opt = QString::fromStdString(j.get<std::string>()); }
    };

    template<> struct adl_serializer<QByteArray>
    {
        static void to_json(json &j, const QByteArray &opt) { j = opt.toStdString(); }

        static void from_json(const json &j, QByteArray &opt) { opt = QByteArray::fromStdString(j.get<std::string>()); }
    };

    // Clockify wants whole seconds in UTC; it answers with or without milliseconds.
    template<> struct adl_serializer<QDateTime>
    {
        static void to_json(json &j, const QDateTime &opt)
        {
            j = opt.toUTC().toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss'Z'")).toStdString();
        }

        static void from_json(const json &j, QDateTime &opt)
        {
            opt = QDateTime::fromString(QString::fromStdString(j.get<std::string>()), Qt::ISODateWithMs);
        }
    };
} // namespace nlohmann

#endif // JSONHELPER_H
