//  Estimate_Control.hpp
//  SolarYield
//
//  Key/value control file of the estimate CLI.
//
#ifndef Estimate_Control_hpp
#define Estimate_Control_hpp

#include <stdio.h>
#include "Macros.hpp"
#include "PanelArray.hpp"

enum SunshineMode {
    SUNSHINE_CLIMATE = 0,   /* climate-zone table only */
    SUNSHINE_FIXED = 1,     /* ANNUAL_SUNSHINE_HOURS */
    SUNSHINE_NETCDF = 2     /* SUNSHINE_FILE / SUNSHINE_VAR */
};

static inline const char *SunshineModeName(SunshineMode mode)
{
    switch (mode) {
        case SUNSHINE_CLIMATE: return "CLIMATE";
        case SUNSHINE_FIXED:   return "FIXED";
        case SUNSHINE_NETCDF:  return "NETCDF";
        default:               return "UNKNOWN";
    }
}

class Estimate_Control {
public:
    int Verbose = 0;

    double latitude = NA_VALUE;         /* LATITUDE [deg] */
    double longitude = NA_VALUE;        /* LONGITUDE [deg] */

    double lineLength = NA_VALUE;       /* LINE_LENGTH [m] */
    double lineAzimuth = NA_VALUE;      /* LINE_AZIMUTH [deg], bearing from start to end */
    PanelSide panelSide = SIDE_LEFT;    /* PANEL_SIDE */

    double panelLength = 2.0;           /* PANEL_LENGTH [m] */
    double panelWidth = 1.0;            /* PANEL_WIDTH [m] */
    double panelWattage = 400.0;        /* PANEL_WATTAGE [W] */
    PanelMount panelMount = MOUNT_LENGTH;   /* PANEL_MOUNT */
    int panelCount = NA_VALUE;          /* PANEL_COUNT, overrides the line-derived count */
    double maxSystemWattage = 2000.0;   /* MAX_SYSTEM_WATTAGE [W] */
    double wattageLeeway = 200.0;       /* WATTAGE_LEEWAY [W] */

    double panelAzimuth = NA_VALUE;     /* PANEL_AZIMUTH [deg], overrides the line-derived azimuth */
    double panelTilt = 90.0;            /* PANEL_TILT [deg] */

    double electricityPrice = 0.32;     /* ELECTRICITY_PRICE [currency/kWh] */

    SunshineMode sunshine_mode = SUNSHINE_CLIMATE;
    double annualSunshineHours = NA_VALUE;  /* ANNUAL_SUNSHINE_HOURS [h/yr] */
    char sunshine_file[MAXLEN] = "";        /* SUNSHINE_FILE, resolved against the control file directory */
    char sunshine_var[MAXLEN] = "sunshine_hours";  /* SUNSHINE_VAR */

    int temperatureCorrection = 0;      /* TEMPERATURE_CORRECTION 0/1 */
    long detailDate = 0;                /* DETAIL_DATE YYYYMMDD, 0 = none */

    int NumUnknown = 0;                 /* keys that were not recognized */

    Estimate_Control();

    /* ERRSUCCESS, or ERRFileIO when the file cannot be opened. */
    int read(const char *fn);

    /* Echo of the effective settings. */
    void print(FILE *fp) const;

    /* Panel geometry as consumed by buildPanelArray(). */
    PanelLayout layout() const;

    /* PANEL_AZIMUTH when given, otherwise derived from LINE_AZIMUTH and PANEL_SIDE. */
    double effectivePanelAzimuth() const;
};

#endif /* Estimate_Control_hpp */
