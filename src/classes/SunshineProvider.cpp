#include "SunshineProvider.hpp"

#include "IrradianceCurve.hpp"
#include "SolarTrace.hpp"

#include <cmath>

PeakSunHours resolvePeakSunHours(const SunshineProvider *provider,
                                 double lat_deg,
                                 double lon_deg,
                                 SolarTrace *trace)
{
    PeakSunHours p;
    double hours = NA_VALUE;
    if (provider != nullptr && provider->annualSunshineHours(lat_deg, lon_deg, hours) &&
        std::isfinite(hours) && hours > 0.0 && hours <= kMaxAnnualSunshineHours) {
        p.annualHours = hours;
        p.hoursPerDay = hours / kDaysPerYear;
        p.measured = true;
        tracef(trace, TRACE_DEBUG, "sunshine: %s provider, %.1f h/yr (%.3f h/day)",
               provider->name(), p.annualHours, p.hoursPerDay);
        return p;
    }

    const ClimateZone zone = climateZone(lat_deg);
    p.annualHours = climateZoneAnnualIrradiance(zone);
    p.hoursPerDay = p.annualHours / kDaysPerYear;
    p.measured = false;
    tracef(trace, TRACE_NOTICE,
           "no measured sunshine data%s%s; using %s climate-zone estimate of %.0f kWh/m2/yr.",
           provider != nullptr ? " from " : "",
           provider != nullptr ? provider->name() : "",
           ClimateZoneName(zone),
           p.annualHours);
    return p;
}
