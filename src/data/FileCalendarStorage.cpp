#include "headsup/data/FileCalendarStorage.hpp"

#include "headsup/Logging.hpp"
#include "headsup/data/MeetingLinks.hpp"

#include <QDate>
#include <QFile>
#include <QTextStream>
#include <QTime>
#include <QTimeZone>
#include <QUuid>

namespace headsup {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

void appendLinks(QList<QUrl> &links, const QList<QUrl> &found)
{
    for (const QUrl &url : found) {
        if (!links.contains(url)) {
            links.append(url);
        }
    }
}
} // namespace

FileCalendarStorage::FileCalendarStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileCalendarStorage::filePath() const
{
    return m_filePath;
}

const QHash<QString, MeetingEvent> &FileCalendarStorage::events() const
{
    return m_events;
}

bool FileCalendarStorage::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCWarning(HEADSUP_DATA_LOG) << "FileCalendarStorage::load: no calendar file at" << m_filePath;
        return false;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(HEADSUP_DATA_LOG) << "FileCalendarStorage::load: cannot open" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    QHash<QString, MeetingEvent> loaded;
    bool inEvent = false;
    bool hasStart = false;
    MeetingEvent currentEvent;

    auto finalizeEvent = [&]() {
        if (!hasStart || !currentEvent.start.isValid()) {
            qCWarning(HEADSUP_DATA_LOG) << "FileCalendarStorage::load: skipping event without DTSTART" << currentEvent.title;
            return;
        }
        if (currentEvent.id.isEmpty()) {
            currentEvent.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        }
        if (!currentEvent.end.isValid() || currentEvent.end <= currentEvent.start) {
            currentEvent.end = currentEvent.start.addSecs(30 * 60);
        }
        appendLinks(currentEvent.links, MeetingLinks::extractLinks(currentEvent.location));
        appendLinks(currentEvent.links, MeetingLinks::extractLinks(currentEvent.description));
        loaded.insert(currentEvent.id, currentEvent);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            hasStart = false;
            currentEvent = MeetingEvent{};
            currentEvent.calendarId = m_filePath;
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }
        if (!inEvent) {
            return;
        }

        // Parameter values may be quoted and contain ':', so find the first unquoted colon.
        int colonIndex = -1;
        bool quoted = false;
        for (int i = 0; i < line.size(); ++i) {
            if (line.at(i) == QLatin1Char('"')) {
                quoted = !quoted;
            } else if (line.at(i) == QLatin1Char(':') && !quoted) {
                colonIndex = i;
                break;
            }
        }
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);

        if (name == QLatin1String("UID")) {
            currentEvent.id = value.trimmed();
        } else if (name == QLatin1String("SUMMARY")) {
            currentEvent.title = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            currentEvent.description = value;
        } else if (name == QLatin1String("LOCATION")) {
            currentEvent.location = value;
        } else if (name == QLatin1String("ORGANIZER")) {
            const QString commonName = parameterValue(parameters, QStringLiteral("CN"));
            if (!commonName.isEmpty()) {
                currentEvent.organizer = commonName;
            } else if (rawValue.startsWith(QLatin1String("mailto:"), Qt::CaseInsensitive)) {
                currentEvent.organizer = rawValue.mid(7);
            } else {
                currentEvent.organizer = rawValue;
            }
        } else if (name == QLatin1String("DTSTART")) {
            currentEvent.start = parseDateTime(rawValue, parameters);
            currentEvent.isAllDay = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive)
                || rawValue.size() == 8;
            hasStart = true;
        } else if (name == QLatin1String("DTEND")) {
            currentEvent.end = parseDateTime(rawValue, parameters);
        } else if (name == QLatin1String("URL") || name == QLatin1String("X-GOOGLE-CONFERENCE")) {
            const QUrl url(rawValue.trimmed(), QUrl::StrictMode);
            if (url.isValid()) {
                appendLinks(currentEvent.links, {url});
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    m_events = std::move(loaded);
    qCDebug(HEADSUP_DATA_LOG) << "FileCalendarStorage::load:" << m_events.size() << "events from" << m_filePath;
    return true;
}

QString FileCalendarStorage::decodeText(const QString &text)
{
    QString decoded = text;
    decoded.replace("\\n", "\n", Qt::CaseInsensitive);
    decoded.replace("\\,", ",");
    decoded.replace("\\;", ";");
    decoded.replace("\\\\", "\\");
    return decoded;
}

QString FileCalendarStorage::parameterValue(const QString &parameters, const QString &name)
{
    const QStringList parts = parameters.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf('=');
        if (equals <= 0 || part.left(equals).compare(name, Qt::CaseInsensitive) != 0) {
            continue;
        }
        QString value = part.mid(equals + 1);
        if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"')) {
            value = value.mid(1, value.size() - 2);
        }
        return value;
    }
    return {};
}

QDateTime FileCalendarStorage::parseDateTime(const QString &value, const QString &parameters)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value.left(value.size() - 1), DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    const QString tzid = parameterValue(parameters, QStringLiteral("TZID"));
    if (dt.isValid() && !tzid.isEmpty()) {
        const QTimeZone zone(tzid.toUtf8());
        if (zone.isValid()) {
            dt.setTimeZone(zone);
        }
    }
    return dt;
}

} // namespace data
} // namespace headsup
