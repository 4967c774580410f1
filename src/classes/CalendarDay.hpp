//  CalendarDay.hpp
//  SolarYield
//
//  Conversions between YYYYMMDD dates and day-of-year numbers.
//
#ifndef CalendarDay_hpp
#define CalendarDay_hpp

#include <string>

class CalendarDay {
public:
    CalendarDay();

    /* Returns false (and leaves the day unset) for an invalid date. */
    bool setDate(long yyyymmdd);
    bool isSet() const;

    long date() const;
    int year() const;
    int dayOfYear() const;            /* 1-366, 0 when unset */
    std::string formatDate() const;   /* YYYY-MM-DD */

    static bool isLeapYear(int year);
    static int daysInMonth(int year, unsigned month);
    static int dayOfYear(int year, unsigned month, unsigned day);
    static bool parseYYYYMMDD(long yyyymmdd, int& y, unsigned& m, unsigned& d);

    /* Month name of a day of year in a non-leap year ("January".."December"). */
    static const char *monthName(int dayOfYear);

private:
    long yyyymmdd_;
    int year_;
    unsigned month_;
    unsigned day_;
};

#endif  /* CalendarDay_hpp */
