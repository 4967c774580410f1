//  RegulationResolver.hpp
//  SolarYield
//
//  Regional power-output caps and hemisphere-dependent panel defaults.
//
#ifndef RegulationResolver_hpp
#define RegulationResolver_hpp

#include "Macros.hpp"

#include <string>

class SolarTrace;

struct Location {
    double latitude = NA_VALUE;   /* [deg], [-90, 90] */
    double longitude = NA_VALUE;  /* [deg], [-180, 180] */
};

enum Hemisphere {
    NORTHERN = 0,
    SOUTHERN = 1
};

static inline const char *HemisphereName(Hemisphere h)
{
    switch (h) {
        case NORTHERN: return "Northern";
        case SOUTHERN: return "Southern";
        default:       return "UNKNOWN";
    }
}

/* Caps are NA_VALUE when unconstrained. */
struct RegionalRegulation {
    double maxInverterOutputW;
    double maxPanelCapacityW;
    bool appliesCap;
    std::string regionName;
};

struct LocationInfo {
    Hemisphere hemisphere;
    double optimalAzimuthDeg;
    double optimalTiltDeg;
    double seasonalShiftDays;   /* 182.5 in the southern hemisphere, else 0 */
};

/* Balcony-solar ceiling applied inside the European bounding box. */
constexpr double kBalconyInverterCapW = 800.0;
constexpr double kBalconyPanelCapW = 2000.0;

/* Substituted when a location cannot be interpreted. */
constexpr double kDefaultLatitude = 51.0;
constexpr double kDefaultLongitude = 10.0;

bool isLocationInEurope(double lat_deg, double lon_deg);

bool isLocationUsable(const Location &loc);

RegionalRegulation resolveRegulation(const Location &loc, SolarTrace *trace = nullptr);

LocationInfo locationInfo(double lat_deg);

#endif /* RegulationResolver_hpp */
