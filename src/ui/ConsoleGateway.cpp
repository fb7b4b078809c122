#include "headsup/ui/ConsoleGateway.hpp"

#include "headsup/Logging.hpp"
#include "headsup/core/SnoozeController.hpp"

#include <QDateTime>
#include <QProcess>
#include <QSocketNotifier>
#include <QStringList>

#include <cstdio>
#include <exception>
#include <unistd.h>

namespace headsup {
namespace ui {

namespace {
bool openWithDesktop(const QUrl &url)
{
    return QProcess::startDetached(QStringLiteral("xdg-open"), {url.toString()});
}
} // namespace

ConsoleGateway::ConsoleGateway(QTextStream &output, QObject *parent)
    : QObject(parent)
    , m_output(output)
    , m_linkOpener(openWithDesktop)
{
}

ConsoleGateway::~ConsoleGateway() = default;

void ConsoleGateway::setSnoozeController(core::SnoozeController *controller)
{
    m_snoozeController = controller;
}

void ConsoleGateway::setLinkOpener(LinkOpener opener)
{
    m_linkOpener = std::move(opener);
}

void ConsoleGateway::listenOnStdin()
{
    if (m_stdinNotifier) {
        return;
    }
    m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &ConsoleGateway::readStdin);
}

void ConsoleGateway::showAlert(const data::MeetingEvent &event, bool isFromSnooze)
{
    if (m_activeEvent && m_activeEvent->id == event.id) {
        qCDebug(HEADSUP_UI_LOG) << "ConsoleGateway::showAlert: already showing" << event.title;
        return;
    }
    m_activeEvent = event;

    const qint64 secondsToStart = QDateTime::currentDateTimeUtc().secsTo(event.start);
    QString when;
    if (secondsToStart > 0) {
        when = QStringLiteral("starts in %1 min").arg((secondsToStart + 59) / 60);
    } else {
        when = QStringLiteral("started %1 min ago").arg(-secondsToStart / 60);
    }

    m_output << "\n==================== MEETING ====================\n";
    m_output << event.title << (isFromSnooze ? " (snoozed)" : "") << '\n';
    m_output << event.start.toLocalTime().toString(QStringLiteral("hh:mm")) << " - "
             << event.end.toLocalTime().toString(QStringLiteral("hh:mm")) << "  " << when << '\n';
    if (!event.organizer.isEmpty()) {
        m_output << "Organizer: " << event.organizer << '\n';
    }
    if (const auto link = event.primaryLink()) {
        m_output << data::MeetingLinks::providerName(event.provider()) << ": " << link->toString() << '\n';
    }
    m_output << "Commands: snooze <minutes> | dismiss | join | status\n";
    m_output << "=================================================\n";
    m_output.flush();
    qCInfo(HEADSUP_UI_LOG) << "ConsoleGateway::showAlert: showing" << event.title << "fromSnooze:" << isFromSnooze;
}

void ConsoleGateway::hideAlert()
{
    if (!m_activeEvent) {
        return;
    }
    qCInfo(HEADSUP_UI_LOG) << "ConsoleGateway::hideAlert: hiding" << m_activeEvent->title;
    m_activeEvent.reset();
}

void ConsoleGateway::openMeetingLink(const data::MeetingEvent &event, const QUrl &link)
{
    bool opened = false;
    try {
        opened = m_linkOpener && m_linkOpener(link);
    } catch (const std::exception &error) {
        qCWarning(HEADSUP_UI_LOG) << "ConsoleGateway::openMeetingLink: launcher failed:" << error.what();
    }
    if (!opened) {
        qCWarning(HEADSUP_UI_LOG) << "ConsoleGateway::openMeetingLink: could not open" << link << "for" << event.title;
        return;
    }
    m_output << "Joining " << event.title << ": " << link.toString() << '\n';
    m_output.flush();
}

QString ConsoleGateway::activeEventId() const
{
    return m_activeEvent ? m_activeEvent->id : QString();
}

const std::optional<data::MeetingEvent> &ConsoleGateway::activeEvent() const
{
    return m_activeEvent;
}

bool ConsoleGateway::handleCommand(const QString &line)
{
    const QStringList words = line.simplified().split(' ', Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return false;
    }
    const QString command = words.front().toLower();

    if (command == QLatin1String("status")) {
        if (m_activeEvent) {
            m_output << "Showing: " << m_activeEvent->title << '\n';
        } else {
            m_output << "No alert showing\n";
        }
        m_output.flush();
        return true;
    }

    if (!m_activeEvent) {
        m_output << "No alert showing\n";
        m_output.flush();
        return false;
    }

    if (command == QLatin1String("dismiss")) {
        hideAlert();
        return true;
    }
    if (command == QLatin1String("join")) {
        const data::MeetingEvent event = *m_activeEvent;
        const auto link = event.primaryLink();
        if (!link) {
            m_output << "No meeting link for " << event.title << '\n';
            m_output.flush();
            return false;
        }
        hideAlert();
        openMeetingLink(event, *link);
        return true;
    }
    if (command == QLatin1String("snooze")) {
        bool ok = false;
        const int minutes = words.size() > 1 ? words.at(1).toInt(&ok) : 0;
        if (!ok || minutes <= 0 || !m_snoozeController) {
            m_output << "Usage: snooze <minutes>\n";
            m_output.flush();
            return false;
        }
        const data::MeetingEvent event = *m_activeEvent;
        if (!m_snoozeController->snooze(event, minutes)) {
            m_output << "Could not snooze " << event.title << '\n';
            m_output.flush();
            return false;
        }
        m_output << "Snoozed " << event.title << " for " << minutes << " min\n";
        m_output.flush();
        return true;
    }

    m_output << "Unknown command: " << command << '\n';
    m_output.flush();
    return false;
}

void ConsoleGateway::readStdin()
{
    char buffer[512];
    if (!std::fgets(buffer, sizeof(buffer), stdin)) {
        // EOF: stop watching, alerts keep printing.
        m_stdinNotifier->setEnabled(false);
        return;
    }
    handleCommand(QString::fromLocal8Bit(buffer));
}

} // namespace ui
} // namespace headsup
