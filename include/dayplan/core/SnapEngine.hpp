#pragma once

#include <QDateTime>
#include <QTimeZone>
#include <QUuid>

#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace core {

enum class DragMode
{
    Move,
    ResizeBegin,
    ResizeEnd,
    Duplicate,
};

enum class SnapPolicy
{
    Snap,
    // Pointer time is used as is, typically while a modifier key is held.
    Precision,
};

struct DragProposal
{
    QDateTime begin;
    QDateTime end;
    bool valid = false;
    // Fresh identifier for duplicate and create proposals, null otherwise.
    QUuid newEventId;
};

class SnapEngine
{
public:
    explicit SnapEngine(int snapMinutes = 15,
                        int minimumDurationSeconds = 60,
                        const QTimeZone &displayZone = QTimeZone::systemTimeZone());

    int snapMinutes() const;
    int minimumDurationSeconds() const;
    QTimeZone displayZone() const;

    // Rounds to the nearest grid line counted from local midnight, halves up.
    QDateTime snap(const QDateTime &time) const;
    QDateTime resolve(const QDateTime &pointer, SnapPolicy policy) const;

    // grabOffsetSeconds is the distance between the event begin and the point
    // where the body was grabbed; only used by Move and Duplicate.
    DragProposal propose(const data::CalendarEvent &source,
                         DragMode mode,
                         const QDateTime &pointer,
                         SnapPolicy policy,
                         qint64 grabOffsetSeconds = 0) const;

    // Proposal for a new event dragged out on empty space from anchor to pointer.
    DragProposal proposeCreate(const QDateTime &anchor, const QDateTime &pointer, SnapPolicy policy) const;

private:
    int m_snapMinutes = 15;
    int m_minimumDurationSeconds = 60;
    QTimeZone m_displayZone;
};

} // namespace core
} // namespace dayplan
