#pragma once

#include "headsup/data/Event.hpp"

namespace headsup {
namespace core {

class Scheduler;

/**
 * Turns a "snooze for N minutes" request into a Snooze alert.
 *
 * The originating event is passed explicitly rather than taken from whatever
 * is on screen. Any alert shown for that event is hidden first. The snooze
 * time is never clamped to the meeting start or end.
 */
class SnoozeController
{
public:
    explicit SnoozeController(Scheduler &scheduler);

    void setSnoozeAllowed(bool allowed);
    bool isSnoozeAllowed() const;

    bool snooze(const data::MeetingEvent &event, int minutes);

private:
    Scheduler &m_scheduler;
    bool m_snoozeAllowed = true;
};

} // namespace core
} // namespace headsup
