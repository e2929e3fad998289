#include "dayplan/core/SnapEngine.hpp"

#include <QtGlobal>

namespace dayplan {
namespace core {

namespace {
constexpr qint64 MSecsPerDay = 24 * 60 * 60 * 1000;
}

SnapEngine::SnapEngine(int snapMinutes, int minimumDurationSeconds, const QTimeZone &displayZone)
    : m_snapMinutes(qBound(1, snapMinutes, 24 * 60))
    , m_minimumDurationSeconds(qMax(1, minimumDurationSeconds))
    , m_displayZone(displayZone.isValid() ? displayZone : QTimeZone::systemTimeZone())
{
}

int SnapEngine::snapMinutes() const
{
    return m_snapMinutes;
}

int SnapEngine::minimumDurationSeconds() const
{
    return m_minimumDurationSeconds;
}

QTimeZone SnapEngine::displayZone() const
{
    return m_displayZone;
}

QDateTime SnapEngine::snap(const QDateTime &time) const
{
    if (!time.isValid()) {
        return {};
    }
    const QDateTime local = time.toTimeZone(m_displayZone);
    const qint64 step = static_cast<qint64>(m_snapMinutes) * 60 * 1000;
    const qint64 sinceMidnight = local.time().msecsSinceStartOfDay();
    const qint64 rounded = ((sinceMidnight + step / 2) / step) * step;
    if (rounded >= MSecsPerDay) {
        return local.date().addDays(1).startOfDay(m_displayZone);
    }
    return QDateTime(local.date(), QTime::fromMSecsSinceStartOfDay(static_cast<int>(rounded)), m_displayZone);
}

QDateTime SnapEngine::resolve(const QDateTime &pointer, SnapPolicy policy) const
{
    if (policy == SnapPolicy::Precision) {
        return pointer;
    }
    return snap(pointer);
}

DragProposal SnapEngine::propose(const data::CalendarEvent &source,
                                 DragMode mode,
                                 const QDateTime &pointer,
                                 SnapPolicy policy,
                                 qint64 grabOffsetSeconds) const
{
    DragProposal proposal;
    if (!pointer.isValid() || !data::isValidRange(source.begin, source.end)) {
        return proposal;
    }
    const qint64 quantumMs = static_cast<qint64>(m_minimumDurationSeconds) * 1000;

    switch (mode) {
    case DragMode::Move:
    case DragMode::Duplicate: {
        const QDateTime begin = resolve(pointer.addSecs(-grabOffsetSeconds), policy);
        proposal.begin = begin.toUTC();
        proposal.end = begin.addMSecs(source.durationMs()).toUTC();
        if (mode == DragMode::Duplicate) {
            proposal.newEventId = QUuid::createUuid();
        }
        break;
    }
    case DragMode::ResizeBegin: {
        QDateTime begin = resolve(pointer, policy).toUTC();
        const QDateTime latest = source.end.addMSecs(-quantumMs);
        if (begin > latest) {
            begin = latest;
        }
        proposal.begin = begin;
        proposal.end = source.end;
        break;
    }
    case DragMode::ResizeEnd: {
        QDateTime end = resolve(pointer, policy).toUTC();
        const QDateTime earliest = source.begin.addMSecs(quantumMs);
        if (end < earliest) {
            end = earliest;
        }
        proposal.begin = source.begin;
        proposal.end = end;
        break;
    }
    }
    proposal.valid = data::isValidRange(proposal.begin, proposal.end);
    return proposal;
}

DragProposal SnapEngine::proposeCreate(const QDateTime &anchor, const QDateTime &pointer, SnapPolicy policy) const
{
    DragProposal proposal;
    if (!anchor.isValid() || !pointer.isValid()) {
        return proposal;
    }
    QDateTime begin = resolve(qMin(anchor, pointer), policy).toUTC();
    QDateTime end = resolve(qMax(anchor, pointer), policy).toUTC();
    const qint64 minimumMs = policy == SnapPolicy::Snap
        ? static_cast<qint64>(m_snapMinutes) * 60 * 1000
        : static_cast<qint64>(m_minimumDurationSeconds) * 1000;
    if (begin.msecsTo(end) < minimumMs) {
        end = begin.addMSecs(minimumMs);
    }
    proposal.begin = begin;
    proposal.end = end;
    proposal.newEventId = QUuid::createUuid();
    proposal.valid = true;
    return proposal;
}

} // namespace core
} // namespace dayplan
