//  Macros.hpp
//  SolarYield
//
//  Shared constants, error codes and small numeric helpers.
//
#ifndef Macros_hpp
#define Macros_hpp

#include <cmath>

#define MAXLEN 1024
#define NA_VALUE -9999

/* Exit / return codes */
#define ERRSUCCESS 0
#define ERRFileIO 1
#define ERRDATAIN 2
#define ERRCONSIS 3

constexpr double kPi = 3.141592653589793238462643383279502884;
constexpr double kDeg2Rad = kPi / 180.0;
constexpr double kRad2Deg = 180.0 / kPi;

/* Hours simulated per day; one sample = one hour. */
constexpr int kHoursPerDay = 24;
constexpr int kDaysPerYear = 365;

extern int global_verbose_mode;

inline bool isNA(double x)
{
    return !std::isfinite(x) || x == (double)NA_VALUE;
}

inline double clampValue(double x, double lo, double hi)
{
    if (x < lo) {
        return lo;
    }
    if (x > hi) {
        return hi;
    }
    return x;
}

void myexit(int flag);

#endif /* Macros_hpp */
