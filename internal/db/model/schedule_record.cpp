#include "schedule_record.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace waterfall::db::model {

using waterfall::model::Schedule;
using waterfall::model::ScheduleStatus;

namespace {

waterfall::v1::ScheduleStatus ToProto(ScheduleStatus status) {
  switch (status) {
    case ScheduleStatus::kPending:
      return waterfall::v1::SCHEDULE_STATUS_PENDING;
    case ScheduleStatus::kExecuted:
      return waterfall::v1::SCHEDULE_STATUS_EXECUTED;
    case ScheduleStatus::kSkipped:
      return waterfall::v1::SCHEDULE_STATUS_SKIPPED;
  }
  return waterfall::v1::SCHEDULE_STATUS_UNSPECIFIED;
}

ScheduleStatus FromProto(waterfall::v1::ScheduleStatus status) {
  switch (status) {
    case waterfall::v1::SCHEDULE_STATUS_PENDING:
      return ScheduleStatus::kPending;
    case waterfall::v1::SCHEDULE_STATUS_EXECUTED:
      return ScheduleStatus::kExecuted;
    case waterfall::v1::SCHEDULE_STATUS_SKIPPED:
      return ScheduleStatus::kSkipped;
    default:
      throw std::runtime_error("schedule record has no status");
  }
}

} // namespace

waterfall::v1::ScheduleRecord ToRecord(const Schedule& schedule) {
  waterfall::v1::ScheduleRecord record;
  record.set_next_payment_date(util::FormatDate(schedule.next_payment_date));
  if (schedule.last_executed_date) {
    record.set_last_executed_date(util::FormatDate(*schedule.last_executed_date));
  }
  record.set_status(ToProto(schedule.status));
  record.set_updated_at_ms(util::ToUnixMillis(util::Now()));
  return record;
}

Schedule FromRecord(const waterfall::v1::ScheduleRecord& record) {
  Schedule schedule;
  try {
    schedule.next_payment_date = util::ParseDate(record.next_payment_date());
    if (!record.last_executed_date().empty()) {
      schedule.last_executed_date = util::ParseDate(record.last_executed_date());
    }
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("schedule record: ") + e.what());
  }
  schedule.status = FromProto(record.status());
  return schedule;
}

std::string ToJson(const Schedule& schedule) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToRecord(schedule), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize schedule: " + std::string(status.message()));
  }
  return json;
}

Schedule FromJson(const std::string& json) {
  waterfall::v1::ScheduleRecord            record;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse schedule: " + std::string(status.message()));
  }
  return FromRecord(record);
}

} // namespace waterfall::db::model
