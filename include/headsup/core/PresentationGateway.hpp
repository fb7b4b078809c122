#pragma once

#include <QString>
#include <QUrl>

#include "headsup/data/Event.hpp"

namespace headsup {
namespace core {

/**
 * Boundary through which the scheduler makes alerts visible or audible.
 *
 * Calls arrive synchronously from the scheduler's thread and must return
 * promptly; any slow work (window construction, audio start-up) is the
 * implementation's business. Implementations catch their own failures.
 */
class PresentationGateway
{
public:
    virtual ~PresentationGateway() = default;

    // No-op when the same event is already shown, otherwise replaces the current alert.
    virtual void showAlert(const data::MeetingEvent &event, bool isFromSnooze) = 0;
    // Safe to call when nothing is shown.
    virtual void hideAlert() = 0;
    virtual void openMeetingLink(const data::MeetingEvent &event, const QUrl &link) = 0;
    // Id of the event currently shown, empty when nothing is shown.
    virtual QString activeEventId() const = 0;
};

} // namespace core
} // namespace headsup
