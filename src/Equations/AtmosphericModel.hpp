//  AtmosphericModel.hpp
//  SolarYield
//
//  Clear-sky horizontal irradiance proxy (Kasten-Young air mass).
//
#ifndef AtmosphericModel_hpp
#define AtmosphericModel_hpp

/* Assumed clear-sky peak on a horizontal surface [W/m2]. */
constexpr double kClearSkyPeakWm2 = 1000.0;

double airMass(double elevation_deg);

/* Horizontal irradiance normalized by kClearSkyPeakWm2, in [0, 1]. 0 if elevation <= 0. */
double atmosphericAttenuation(double elevation_deg);

#endif /* AtmosphericModel_hpp */
