#pragma once

#include <QObject>
#include <QTextStream>
#include <functional>
#include <optional>

#include "headsup/core/PresentationGateway.hpp"

class QSocketNotifier;

namespace headsup {
namespace core {
class SnoozeController;
}

namespace ui {

/**
 * Terminal presentation of alerts.
 *
 * Prints a banner for the active alert and accepts commands on stdin:
 * "snooze <minutes>", "dismiss", "join" and "status".
 */
class ConsoleGateway : public QObject, public core::PresentationGateway
{
    Q_OBJECT

public:
    using LinkOpener = std::function<bool(const QUrl &)>;

    explicit ConsoleGateway(QTextStream &output, QObject *parent = nullptr);
    ~ConsoleGateway() override;

    // Non-owning; snooze commands are rejected while unset.
    void setSnoozeController(core::SnoozeController *controller);
    void setLinkOpener(LinkOpener opener);
    void listenOnStdin();

    void showAlert(const data::MeetingEvent &event, bool isFromSnooze) override;
    void hideAlert() override;
    void openMeetingLink(const data::MeetingEvent &event, const QUrl &link) override;
    QString activeEventId() const override;

    bool handleCommand(const QString &line);
    const std::optional<data::MeetingEvent> &activeEvent() const;

private slots:
    void readStdin();

private:
    QTextStream &m_output;
    core::SnoozeController *m_snoozeController = nullptr;
    LinkOpener m_linkOpener;
    QSocketNotifier *m_stdinNotifier = nullptr;
    std::optional<data::MeetingEvent> m_activeEvent;
};

} // namespace ui
} // namespace headsup
