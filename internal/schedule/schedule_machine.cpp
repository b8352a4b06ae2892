#include "schedule_machine.hpp"

#include <string>

#include "internal/calendar/calendar_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::schedule {

using waterfall::model::ScheduleStatus;
using waterfall::observability::DateField;
using waterfall::observability::StringField;

ScheduleMachine::ScheduleMachine(model::Schedule schedule, const calendar::HolidayCalendar& calendar)
    : schedule_(std::move(schedule)), calendar_(calendar) {
}

model::Schedule ScheduleMachine::Initial(util::Date today, const calendar::HolidayCalendar& calendar) {
  model::Schedule schedule;
  schedule.status            = ScheduleStatus::kPending;
  schedule.next_payment_date = calendar::PaydayOf(today, calendar);
  if (today > schedule.next_payment_date) {
    schedule.next_payment_date = calendar::PaydayAfter(today, calendar);
  }
  return schedule;
}

bool ScheduleMachine::IsDue(util::Date today) const {
  return schedule_.status == ScheduleStatus::kPending && calendar::IsDue(today, schedule_.next_payment_date);
}

void ScheduleMachine::MarkExecuted(util::Date run_date) {
  Transition(ScheduleStatus::kExecuted);
  schedule_.last_executed_date = run_date;
}

void ScheduleMachine::MarkSkipped() {
  Transition(ScheduleStatus::kSkipped);
}

util::Date ScheduleMachine::Advance() {
  if (!model::IsTerminal(schedule_.status)) {
    throw util::InvalidState("cannot advance schedule for " + util::FormatDate(schedule_.next_payment_date) + " while it is " +
                             std::string(model::ToString(schedule_.status)));
  }

  const util::Date previous = schedule_.next_payment_date;
  const util::Date next     = calendar::PaydayAfter(previous, calendar_);

  Transition(ScheduleStatus::kPending);
  schedule_.next_payment_date = next;

  WATERFALL_LOG_INFO("Schedule advanced", {DateField("previous", previous), DateField("next_payment_date", next)});
  return next;
}

void ScheduleMachine::Reset(util::Date next_payment_date) {
  WATERFALL_LOG_WARN("Schedule reset", {DateField("from", schedule_.next_payment_date), StringField("status", model::ToString(schedule_.status)),
                                        DateField("to", next_payment_date)});
  schedule_.next_payment_date = next_payment_date;
  schedule_.status            = ScheduleStatus::kPending;
}

void ScheduleMachine::Transition(ScheduleStatus to) {
  if (!model::CanTransition(schedule_.status, to)) {
    throw util::InvalidState("illegal schedule transition " + std::string(model::ToString(schedule_.status)) + " -> " +
                             std::string(model::ToString(to)));
  }
  schedule_.status = to;
}

} // namespace waterfall::schedule
