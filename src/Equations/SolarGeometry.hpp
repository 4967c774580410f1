//  SolarGeometry.hpp
//  SolarYield
//
#ifndef SolarGeometry_hpp
#define SolarGeometry_hpp

struct SunPosition {
    double elevationDeg;   /* sun elevation [deg], 0 when below the horizon */
    double azimuthDeg;     /* sun azimuth [deg], [0, 360), North=0, East=90 */
    double hourAngleDeg;   /* hour angle [deg], 0 at solar noon, positive afternoon */
    double declinationDeg; /* solar declination [deg] */
};

/* Solar declination (Cooper) for a day of the year [deg]. */
double solarDeclination(int dayOfYear);

/*
 * Sun position for a whole local solar hour.
 *
 * hour is 0..23 (12 = solar noon). Elevation is clamped to >= 0; callers
 * must treat elevation 0 as "no production".
 */
SunPosition solarPosition(int hour, int dayOfYear, double lat_deg);

#endif /* SolarGeometry_hpp */
