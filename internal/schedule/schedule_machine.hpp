#pragma once

#include "internal/calendar/holiday_calendar.hpp"
#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace waterfall::schedule {

/*
  Lifecycle of one pay cycle.

      Pending --MarkExecuted--> Executed --Advance--> Pending (next month)
      Pending --MarkSkipped---> Skipped  --Advance--> Pending (next month)

  Advance() is the only way next_payment_date moves forward and is legal only
  from a terminal status. Illegal transitions throw util::InvalidState.

  The machine works on a value; persisting it is the caller's job. The
  calendar must outlive the machine.
*/
class ScheduleMachine {
 public:
  ScheduleMachine(model::Schedule schedule, const calendar::HolidayCalendar& calendar);

  // First schedule for a fresh store: this month's payday unless it has
  // already passed, in which case next month's.
  static model::Schedule Initial(util::Date today, const calendar::HolidayCalendar& calendar);

  const model::Schedule& Current() const {
    return schedule_;
  }

  // Pending and today >= next_payment_date.
  bool IsDue(util::Date today) const;

  void MarkExecuted(util::Date run_date);
  void MarkSkipped();

  // Returns the new next_payment_date.
  util::Date Advance();

  // Operator override: Pending at the given date, history kept.
  void Reset(util::Date next_payment_date);

 private:
  void Transition(model::ScheduleStatus to);

  model::Schedule                  schedule_;
  const calendar::HolidayCalendar& calendar_;
};

} // namespace waterfall::schedule
