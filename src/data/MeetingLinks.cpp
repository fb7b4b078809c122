#include "headsup/data/MeetingLinks.hpp"

#include "headsup/Logging.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace headsup {
namespace data {

namespace {
const QStringList &trustedMeetingDomains()
{
    static const QStringList domains {
        QStringLiteral("meet.google.com"),
        QStringLiteral("zoom.us"),
        QStringLiteral("teams.microsoft.com"),
        QStringLiteral("webex.com"),
        QStringLiteral("gotomeeting.com"),
        QStringLiteral("whereby.com"),
        QStringLiteral("around.co"),
    };
    return domains;
}

bool urlContainsAny(const QUrl &url, std::initializer_list<QLatin1String> needles)
{
    const QString text = url.toString().toLower();
    for (const auto &needle : needles) {
        if (text.contains(needle)) {
            return true;
        }
    }
    return false;
}
} // namespace

bool MeetingLinks::isValidMeetingUrl(const QUrl &url)
{
    if (!url.isValid() || url.scheme().compare(QLatin1String("https"), Qt::CaseInsensitive) != 0) {
        qCDebug(HEADSUP_DATA_LOG) << "MeetingLinks::isValidMeetingUrl: rejected non-https url" << url;
        return false;
    }
    const QString host = url.host().toLower();
    if (host.isEmpty()) {
        return false;
    }
    for (const QString &domain : trustedMeetingDomains()) {
        if (host == domain || host.endsWith(QLatin1Char('.') + domain)) {
            return true;
        }
    }
    qCDebug(HEADSUP_DATA_LOG) << "MeetingLinks::isValidMeetingUrl: rejected untrusted host" << host;
    return false;
}

std::optional<QUrl> MeetingLinks::primaryLink(const QList<QUrl> &links)
{
    QList<QUrl> valid;
    for (const QUrl &url : links) {
        if (isValidMeetingUrl(url)) {
            valid.append(url);
        }
    }
    if (valid.isEmpty()) {
        return std::nullopt;
    }

    // Google Meet first, then the other large video providers, then anything trusted.
    for (const QUrl &url : valid) {
        if (detectProvider(url) == MeetingProvider::GoogleMeet) {
            return url;
        }
    }
    for (const QUrl &url : valid) {
        if (detectProvider(url) != MeetingProvider::Generic) {
            return url;
        }
    }
    return valid.front();
}

MeetingProvider MeetingLinks::detectProvider(const QUrl &url)
{
    if (urlContainsAny(url, {QLatin1String("meet.google.com"), QLatin1String("g.co/meet")})) {
        return MeetingProvider::GoogleMeet;
    }
    if (urlContainsAny(url, {QLatin1String("zoom.us"), QLatin1String("zoommtg://")})) {
        return MeetingProvider::Zoom;
    }
    if (urlContainsAny(url, {QLatin1String("teams.microsoft.com"), QLatin1String("teams.live.com"),
                             QLatin1String("msteams://")})) {
        return MeetingProvider::Teams;
    }
    if (urlContainsAny(url, {QLatin1String("webex.com"), QLatin1String("webex://")})) {
        return MeetingProvider::Webex;
    }
    return MeetingProvider::Generic;
}

QString MeetingLinks::providerName(MeetingProvider provider)
{
    switch (provider) {
    case MeetingProvider::GoogleMeet:
        return QStringLiteral("Google Meet");
    case MeetingProvider::Zoom:
        return QStringLiteral("Zoom");
    case MeetingProvider::Teams:
        return QStringLiteral("Microsoft Teams");
    case MeetingProvider::Webex:
        return QStringLiteral("Cisco Webex");
    case MeetingProvider::Generic:
    default:
        return QStringLiteral("Other");
    }
}

QList<QUrl> MeetingLinks::extractLinks(const QString &text)
{
    static const QRegularExpression urlPattern(QStringLiteral("https?://[^\\s<>\"']+"),
                                               QRegularExpression::CaseInsensitiveOption);
    QList<QUrl> links;
    auto it = urlPattern.globalMatch(text);
    while (it.hasNext()) {
        QString candidate = it.next().captured(0);
        // Trailing punctuation belongs to the sentence, not the link.
        while (!candidate.isEmpty() && QStringLiteral(".,;:)]").contains(candidate.back())) {
            candidate.chop(1);
        }
        const QUrl url(candidate, QUrl::StrictMode);
        if (url.isValid() && !links.contains(url)) {
            links.append(url);
        }
    }
    return links;
}

} // namespace data
} // namespace headsup
