#include "identity/calendar_date.hpp"
#include "utils/error_handler.hpp"
#include <cctype>
#include <cstdio>

namespace voiceguard {
namespace identity {

namespace {

bool parseDigits(const std::string& text, size_t pos, size_t count, int& out) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

CalendarDate::CalendarDate(int year, int month, int day)
    : year_(year), month_(month), day_(day) {
    if (year < 1 || year > 9999) {
        throw utils::ValidationException("Year out of range", "date_of_birth");
    }
    if (month < 1 || month > 12) {
        throw utils::ValidationException("Month out of range", "date_of_birth");
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        throw utils::ValidationException("Day out of range for month", "date_of_birth");
    }
}

CalendarDate CalendarDate::parse(const std::string& text) {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw utils::ValidationException("Date must use the YYYY-MM-DD format", "date_of_birth");
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseDigits(text, 0, 4, year) || !parseDigits(text, 5, 2, month) ||
        !parseDigits(text, 8, 2, day)) {
        throw utils::ValidationException("Date must use the YYYY-MM-DD format", "date_of_birth");
    }

    return CalendarDate(year, month, day);
}

bool CalendarDate::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::string CalendarDate::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year_, month_, day_);
    return buffer;
}

} // namespace identity
} // namespace voiceguard
