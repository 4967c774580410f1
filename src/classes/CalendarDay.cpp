#include "CalendarDay.hpp"

#include <iomanip>
#include <sstream>

CalendarDay::CalendarDay()
    : yyyymmdd_(0),
      year_(0),
      month_(0),
      day_(0) {
}

bool CalendarDay::setDate(long yyyymmdd) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (!parseYYYYMMDD(yyyymmdd, y, m, d)) {
        yyyymmdd_ = 0;
        year_ = 0;
        month_ = 0;
        day_ = 0;
        return false;
    }
    yyyymmdd_ = yyyymmdd;
    year_ = y;
    month_ = m;
    day_ = d;
    return true;
}

bool CalendarDay::isSet() const {
    return yyyymmdd_ > 0;
}

long CalendarDay::date() const {
    return yyyymmdd_;
}

int CalendarDay::year() const {
    return year_;
}

int CalendarDay::dayOfYear() const {
    if (!isSet()) {
        return 0;
    }
    return dayOfYear(year_, month_, day_);
}

std::string CalendarDay::formatDate() const {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << year_ << "-"
        << std::setw(2) << std::setfill('0') << month_ << "-"
        << std::setw(2) << std::setfill('0') << day_;
    return oss.str();
}

bool CalendarDay::isLeapYear(int year) {
    if ((year % 4) != 0) {
        return false;
    }
    if ((year % 100) != 0) {
        return true;
    }
    return (year % 400) == 0;
}

int CalendarDay::daysInMonth(int year, unsigned month) {
    static const int dim[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return dim[month - 1];
}

int CalendarDay::dayOfYear(int year, unsigned month, unsigned day) {
    static const int cum[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
    if (month < 1 || month > 12) {
        return 0;
    }
    int doy = cum[month - 1] + (int)day;
    if (month > 2 && isLeapYear(year)) {
        doy += 1;
    }
    return doy;
}

bool CalendarDay::parseYYYYMMDD(long yyyymmdd, int& y, unsigned& m, unsigned& d) {
    if (yyyymmdd <= 0) {
        return false;
    }
    y = (int)(yyyymmdd / 10000);
    long md = yyyymmdd % 10000;
    m = (unsigned)(md / 100);
    d = (unsigned)(md % 100);
    if (m < 1 || m > 12) {
        return false;
    }
    int dim = daysInMonth(y, m);
    if (dim <= 0 || d < 1 || (int)d > dim) {
        return false;
    }
    return true;
}

const char *CalendarDay::monthName(int dayOfYear) {
    static const char *const names[12] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };
    static const int cum[13] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334, 365};
    if (dayOfYear < 1 || dayOfYear > 366) {
        return "UNKNOWN";
    }
    for (int i = 0; i < 12; i++) {
        if (dayOfYear <= cum[i + 1]) {
            return names[i];
        }
    }
    return names[11];
}
