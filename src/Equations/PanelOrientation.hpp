//  PanelOrientation.hpp
//  SolarYield
//
#ifndef PanelOrientation_hpp
#define PanelOrientation_hpp

/*
 * Cosine of the incidence angle between the sun ray and the normal of a
 * panel tilted panelTilt_deg from horizontal and facing panelAzimuth_deg
 * (North=0, East=90). 1 = sun perpendicular to the panel; 0 = sun in the
 * panel plane, behind it, or below the horizon.
 */
double orientationFactor(double sunElevation_deg,
                         double sunAzimuth_deg,
                         double panelTilt_deg,
                         double panelAzimuth_deg);

#endif /* PanelOrientation_hpp */
