#pragma once

#include "internal/db/model/event_record.hpp"

namespace chronicle::events {

// An event as read back from the log.
using RecordedEvent = db::model::EventRecord;

} // namespace chronicle::events
