//  SunshineProvider.hpp
//  SolarYield
//
//  Source of measured annual sunshine hours for a location. Every provider
//  may be unavailable; callers then fall back to the climate-zone table.
//
#ifndef SunshineProvider_hpp
#define SunshineProvider_hpp

#include "Macros.hpp"

class SolarTrace;

/* hours in a leap year; larger annual sunshine values are not data */
constexpr double kMaxAnnualSunshineHours = 8784.0;

class SunshineProvider {
public:
    virtual ~SunshineProvider() = default;

    /* Returns true and sets hours [h/yr] when a usable value exists. */
    virtual bool annualSunshineHours(double lat_deg, double lon_deg, double &hours) const = 0;

    virtual const char *name() const = 0;
};

/* A single user-supplied value for every location. */
class FixedSunshineProvider final : public SunshineProvider {
public:
    explicit FixedSunshineProvider(double hours) : hours_(hours) {}

    bool annualSunshineHours(double lat_deg, double lon_deg, double &hours) const override
    {
        (void)lat_deg;
        (void)lon_deg;
        if (isNA(hours_) || !(hours_ > 0.0) || hours_ > kMaxAnnualSunshineHours) {
            return false;
        }
        hours = hours_;
        return true;
    }

    const char *name() const override { return "FIXED"; }

private:
    double hours_ = NA_VALUE;
};

struct PeakSunHours {
    double hoursPerDay;
    double annualHours;
    bool measured;      /* false when the climate-zone table was used */
};

/*
 * provider value / 365 when available, positive and at most
 * kMaxAnnualSunshineHours; otherwise the
 * climate-zone annual irradiance / 365 (logged as a notice).
 * provider may be nullptr.
 */
PeakSunHours resolvePeakSunHours(const SunshineProvider *provider,
                                 double lat_deg,
                                 double lon_deg,
                                 SolarTrace *trace = nullptr);

#endif /* SunshineProvider_hpp */
