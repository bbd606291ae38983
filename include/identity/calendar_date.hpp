#pragma once

#include <string>

namespace voiceguard {
namespace identity {

/**
 * Calendar date in the proleptic Gregorian calendar.
 * Only the unambiguous YYYY-MM-DD form is accepted.
 */
class CalendarDate {
public:
    CalendarDate(int year, int month, int day);

    /**
     * @throws ValidationException on a malformed string or an impossible date
     */
    static CalendarDate parse(const std::string& text);

    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    std::string toString() const;

    bool operator==(const CalendarDate& other) const {
        return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }

private:
    int year_;
    int month_;
    int day_;
};

} // namespace identity
} // namespace voiceguard
