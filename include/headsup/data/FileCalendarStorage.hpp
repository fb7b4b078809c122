#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>

#include "headsup/data/Event.hpp"

namespace headsup {
namespace data {

/**
 * Read-only view of an iCalendar (.ics) file.
 *
 * Only VEVENT components are read. The file is owned by whatever produces it
 * (a calendar export, a sync daemon); this class never writes to it.
 */
class FileCalendarStorage
{
public:
    explicit FileCalendarStorage(QString filePath);
    ~FileCalendarStorage() = default;

    const QString &filePath() const;
    const QHash<QString, MeetingEvent> &events() const;

    // Replaces the loaded events with the current file contents. Returns false
    // (keeping the previous events) if the file cannot be read.
    bool load();

private:
    static QString decodeText(const QString &text);
    static QString parameterValue(const QString &parameters, const QString &name);
    static QDateTime parseDateTime(const QString &value, const QString &parameters);

    QString m_filePath;
    QHash<QString, MeetingEvent> m_events;
};

} // namespace data
} // namespace headsup
