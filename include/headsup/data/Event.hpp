#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QUrl>
#include <optional>

#include "headsup/data/MeetingLinks.hpp"

namespace headsup {
namespace data {

struct MeetingEvent
{
    QString id;
    QString title;
    QDateTime start;
    QDateTime end;
    QString organizer;
    QString description;
    QString location;
    QString calendarId;
    bool isAllDay = false;
    QList<QUrl> links;

    // Seconds between start and end.
    qint64 duration() const { return start.secsTo(end); }

    std::optional<QUrl> primaryLink() const { return MeetingLinks::primaryLink(links); }
    bool isOnlineMeeting() const { return primaryLink().has_value(); }
    MeetingProvider provider() const
    {
        const auto link = primaryLink();
        return link ? MeetingLinks::detectProvider(*link) : MeetingProvider::Generic;
    }
};

} // namespace data
} // namespace headsup
