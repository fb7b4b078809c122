#pragma once

#include <QList>
#include <QString>
#include <QUrl>
#include <optional>

namespace headsup {
namespace data {

enum class MeetingProvider {
    GoogleMeet,
    Zoom,
    Teams,
    Webex,
    Generic
};

/**
 * Recognition of joinable video meeting links.
 *
 * Only https links whose host is one of the trusted meeting domains (or a
 * subdomain of one) are considered joinable; everything else is ignored when
 * picking the link to open for auto-join.
 */
class MeetingLinks
{
public:
    static bool isValidMeetingUrl(const QUrl &url);
    static std::optional<QUrl> primaryLink(const QList<QUrl> &links);
    static MeetingProvider detectProvider(const QUrl &url);
    static QString providerName(MeetingProvider provider);

    // http(s) URLs found in free text, in order of appearance, without duplicates.
    static QList<QUrl> extractLinks(const QString &text);
};

} // namespace data
} // namespace headsup
