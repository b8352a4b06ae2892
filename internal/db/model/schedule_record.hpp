#pragma once

#include <string>

#include "internal/model/schedule.hpp"
#include "waterfall/v1/schedule.pb.h"

namespace waterfall::db::model {

/*
  Conversion between the in-memory Schedule and its stored form.

  The stored form is waterfall.v1.ScheduleRecord; the file backend writes it
  as JSON.
*/

waterfall::v1::ScheduleRecord ToRecord(const waterfall::model::Schedule& schedule);

// Throws std::runtime_error on a record that does not describe a valid schedule.
waterfall::model::Schedule FromRecord(const waterfall::v1::ScheduleRecord& record);

std::string                ToJson(const waterfall::model::Schedule& schedule);
waterfall::model::Schedule FromJson(const std::string& json);

} // namespace waterfall::db::model
