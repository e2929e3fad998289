#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "dayplan/core/Error.hpp"
#include "dayplan/data/Event.hpp"

namespace dayplan {
namespace core {

// Durable storage for the events of one group. Implementations must leave the
// previous durable state intact when they report a failure.
class PersistenceSink
{
public:
    virtual ~PersistenceSink() = default;

    virtual std::optional<Error> writeGroup(const QString &group, const std::vector<data::CalendarEvent> &events) = 0;
};

} // namespace core
} // namespace dayplan
