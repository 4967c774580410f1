#include "RegulationResolver.hpp"

#include "SolarTrace.hpp"

#include <cmath>

bool isLocationInEurope(double lat_deg, double lon_deg)
{
    const bool in_lat = lat_deg >= 35.0 && lat_deg <= 71.0;
    const bool in_lon = lon_deg >= -10.0 && lon_deg <= 40.0;
    return in_lat && in_lon;
}

bool isLocationUsable(const Location &loc)
{
    return !isNA(loc.latitude) && !isNA(loc.longitude);
}

RegionalRegulation resolveRegulation(const Location &loc, SolarTrace *trace)
{
    RegionalRegulation reg;
    if (!isLocationUsable(loc)) {
        tracef(trace, TRACE_WARNING,
               "location (%.4f, %.4f) cannot be interpreted; applying default European balcony-solar caps.",
               loc.latitude, loc.longitude);
        reg.maxInverterOutputW = kBalconyInverterCapW;
        reg.maxPanelCapacityW = kBalconyPanelCapW;
        reg.appliesCap = true;
        reg.regionName = "Europe (balcony-solar caps, default)";
        return reg;
    }

    if (isLocationInEurope(loc.latitude, loc.longitude)) {
        reg.maxInverterOutputW = kBalconyInverterCapW;
        reg.maxPanelCapacityW = kBalconyPanelCapW;
        reg.appliesCap = true;
        reg.regionName = "Europe (balcony-solar caps)";
    } else {
        reg.maxInverterOutputW = NA_VALUE;
        reg.maxPanelCapacityW = NA_VALUE;
        reg.appliesCap = false;
        reg.regionName = "Outside Europe";
    }
    tracef(trace, TRACE_DEBUG, "regulation: %s (inverter cap %.0f W, panel cap %.0f W)",
           reg.regionName.c_str(), reg.maxInverterOutputW, reg.maxPanelCapacityW);
    return reg;
}

LocationInfo locationInfo(double lat_deg)
{
    LocationInfo info;
    if (lat_deg >= 0.0) {
        info.hemisphere = NORTHERN;
        info.optimalAzimuthDeg = 180.0;
        info.seasonalShiftDays = 0.0;
    } else {
        info.hemisphere = SOUTHERN;
        info.optimalAzimuthDeg = 0.0;
        info.seasonalShiftDays = 182.5;
    }
    info.optimalTiltDeg = clampValue(std::fabs(lat_deg), 10.0, 60.0);
    return info;
}
