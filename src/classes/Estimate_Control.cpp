#include "Estimate_Control.hpp"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

namespace {

/* Relative paths are taken relative to the directory of the control file. */
void resolveRelativePath(const char *ctrl_fn, char *path)
{
    if (path[0] == '\0') {
        return;
    }
    const bool is_abs = (path[0] == '/' || path[0] == '\\' ||
                         (isalpha((unsigned char)path[0]) && path[1] == ':'));
    if (is_abs) {
        return;
    }

    char base_dir[MAXLEN];
    strncpy(base_dir, ctrl_fn, MAXLEN - 1);
    base_dir[MAXLEN - 1] = '\0';
    char *last_slash = strrchr(base_dir, '/');
    char *last_bslash = strrchr(base_dir, '\\');
    if (last_bslash != NULL && (last_slash == NULL || last_bslash > last_slash)) {
        last_slash = last_bslash;
    }
    if (last_slash == NULL) {
        return;
    }
    *last_slash = '\0';

    char resolved[MAXLEN];
    snprintf(resolved, MAXLEN, "%s/%s", base_dir, path);
    strncpy(path, resolved, MAXLEN - 1);
    path[MAXLEN - 1] = '\0';
}

} // namespace

Estimate_Control::Estimate_Control() {}

int Estimate_Control::read(const char *fn){
    char    str[MAXLEN];
    char    optstr[MAXLEN];
    char    valstr[MAXLEN];

    FILE *fp = fopen(fn, "r");
    if (fp == NULL) {
        fprintf(stderr, "\n  Fatal Error: \n %s is in use or does not exist!\n", fn);
        return ERRFileIO;
    }
    /* Read through control file to find parameters */
    double val;
    while (fgets(str, MAXLEN, fp)) {
        if (str[0] == '#' || str[0] == '\n' || str[0] == '\r' || str[0] == '\0' || str[0] == ' ')
        {
            continue;
        }
        val = NA_VALUE;
        valstr[0] = '\0';
        const int nread = sscanf(str, "%s %s", optstr, valstr);
        if (nread < 1) {
            continue;
        }
        if (nread == 2) {
            sscanf(str, "%s %lf", optstr, &val);
        }

        /* Location */
        if (strcasecmp ("LATITUDE", optstr) == 0)
            latitude = val;
        else if (strcasecmp ("LONGITUDE", optstr) == 0)
            longitude = val;
        /* Mounting line */
        else if (strcasecmp ("LINE_LENGTH", optstr) == 0)
            lineLength = val;
        else if (strcasecmp ("LINE_AZIMUTH", optstr) == 0)
            lineAzimuth = val;
        else if (strcasecmp ("PANEL_SIDE", optstr) == 0) {
            if (strcasecmp(valstr, "LEFT") == 0) {
                panelSide = SIDE_LEFT;
            } else if (strcasecmp(valstr, "RIGHT") == 0) {
                panelSide = SIDE_RIGHT;
            } else {
                fprintf(stderr,
                        "WARNING: invalid PANEL_SIDE value '%s' in %s; using %s. Valid values: LEFT/RIGHT.\n",
                        valstr, fn, PanelSideName(panelSide));
            }
        }
        /* Panels */
        else if (strcasecmp ("PANEL_LENGTH", optstr) == 0)
            panelLength = val;
        else if (strcasecmp ("PANEL_WIDTH", optstr) == 0)
            panelWidth = val;
        else if (strcasecmp ("PANEL_WATTAGE", optstr) == 0)
            panelWattage = val;
        else if (strcasecmp ("PANEL_MOUNT", optstr) == 0) {
            if (strcasecmp(valstr, "LENGTH") == 0) {
                panelMount = MOUNT_LENGTH;
            } else if (strcasecmp(valstr, "WIDTH") == 0) {
                panelMount = MOUNT_WIDTH;
            } else {
                fprintf(stderr,
                        "WARNING: invalid PANEL_MOUNT value '%s' in %s; using %s. Valid values: LENGTH/WIDTH.\n",
                        valstr, fn, PanelMountName(panelMount));
            }
        }
        else if (strcasecmp ("PANEL_COUNT", optstr) == 0)
            panelCount = (int) val;
        else if (strcasecmp ("MAX_SYSTEM_WATTAGE", optstr) == 0)
            maxSystemWattage = val;
        else if (strcasecmp ("WATTAGE_LEEWAY", optstr) == 0)
            wattageLeeway = val;
        /* Orientation */
        else if (strcasecmp ("PANEL_AZIMUTH", optstr) == 0)
            panelAzimuth = val;
        else if (strcasecmp ("PANEL_TILT", optstr) == 0)
            panelTilt = val;
        else if (strcasecmp ("ELECTRICITY_PRICE", optstr) == 0)
            electricityPrice = val;
        /* Sunshine data */
        else if (strcasecmp ("SUNSHINE_MODE", optstr) == 0) {
            const SunshineMode default_mode = SUNSHINE_CLIMATE;
            if (nread != 2) {
                fprintf(stderr,
                        "WARNING: SUNSHINE_MODE missing value in %s; using default %s.\n",
                        fn, SunshineModeName(default_mode));
                sunshine_mode = default_mode;
            } else if (strcasecmp(valstr, "CLIMATE") == 0) {
                sunshine_mode = SUNSHINE_CLIMATE;
            } else if (strcasecmp(valstr, "FIXED") == 0) {
                sunshine_mode = SUNSHINE_FIXED;
            } else if (strcasecmp(valstr, "NETCDF") == 0) {
                sunshine_mode = SUNSHINE_NETCDF;
            } else {
                fprintf(stderr,
                        "WARNING: invalid SUNSHINE_MODE value '%s' in %s; using default %s. "
                        "Valid values: CLIMATE/FIXED/NETCDF.\n",
                        valstr, fn, SunshineModeName(default_mode));
                sunshine_mode = default_mode;
            }
        }
        else if (strcasecmp ("ANNUAL_SUNSHINE_HOURS", optstr) == 0)
            annualSunshineHours = val;
        else if (strcasecmp ("SUNSHINE_FILE", optstr) == 0) {
            if (nread != 2) {
                fprintf(stderr, "WARNING: SUNSHINE_FILE missing value in %s.\n", fn);
            } else {
                strncpy(sunshine_file, valstr, MAXLEN - 1);
                sunshine_file[MAXLEN - 1] = '\0';
            }
        }
        else if (strcasecmp ("SUNSHINE_VAR", optstr) == 0) {
            if (nread == 2) {
                strncpy(sunshine_var, valstr, MAXLEN - 1);
                sunshine_var[MAXLEN - 1] = '\0';
            }
        }
        else if (strcasecmp ("TEMPERATURE_CORRECTION", optstr) == 0) {
            const int flag = (int)val;
            if (flag == 0 || flag == 1) {
                temperatureCorrection = flag;
            } else {
                fprintf(stderr,
                        "WARNING: invalid TEMPERATURE_CORRECTION value %.3f in %s; using %d. Valid values: 0/1.\n",
                        val, fn, temperatureCorrection);
            }
        }
        else if (strcasecmp ("DETAIL_DATE", optstr) == 0)
            detailDate = (nread == 2) ? strtol(valstr, NULL, 10) : 0;
        else if (strcasecmp ("VERBOSE", optstr) == 0)
            Verbose = (int) val;
        /* Unrecognized Parameter Flag */
        else {
            NumUnknown++;
            printf("\n  Parameter:%s cannot be recognized and is ignored.\n", optstr);
        }
    }
    fclose(fp);

    resolveRelativePath(fn, sunshine_file);
    if (sunshine_mode == SUNSHINE_NETCDF && sunshine_file[0] == '\0') {
        fprintf(stderr,
                "WARNING: SUNSHINE_MODE=NETCDF requires SUNSHINE_FILE <path> in %s; "
                "using the climate-zone table.\n",
                fn);
    }
    if (sunshine_mode == SUNSHINE_FIXED && isNA(annualSunshineHours)) {
        fprintf(stderr,
                "WARNING: SUNSHINE_MODE=FIXED without ANNUAL_SUNSHINE_HOURS in %s; "
                "using the climate-zone table.\n",
                fn);
    }
    return ERRSUCCESS;
}

void Estimate_Control::print(FILE *fp) const {
    fprintf(fp, "* \t LATITUDE: %.6f\n", latitude);
    fprintf(fp, "* \t LONGITUDE: %.6f\n", longitude);
    if (panelCount >= 0) {
        fprintf(fp, "* \t PANEL_COUNT: %d\n", panelCount);
    } else {
        fprintf(fp, "* \t LINE_LENGTH: %.2f m\n", lineLength);
        fprintf(fp, "* \t PANEL_MOUNT: %s\n", PanelMountName(panelMount));
    }
    fprintf(fp, "* \t PANEL_SIZE: %.2f x %.2f m, %.0f W\n", panelLength, panelWidth, panelWattage);
    fprintf(fp, "* \t MAX_SYSTEM_WATTAGE: %.0f W (+%.0f W leeway)\n", maxSystemWattage, wattageLeeway);
    if (isNA(panelAzimuth)) {
        fprintf(fp, "* \t LINE_AZIMUTH: %.2f deg, PANEL_SIDE: %s\n", lineAzimuth, PanelSideName(panelSide));
    } else {
        fprintf(fp, "* \t PANEL_AZIMUTH: %.2f deg\n", panelAzimuth);
    }
    fprintf(fp, "* \t PANEL_TILT: %.2f deg\n", panelTilt);
    fprintf(fp, "* \t ELECTRICITY_PRICE: %.4f per kWh\n", electricityPrice);
    fprintf(fp, "* \t SUNSHINE_MODE: %s\n", SunshineModeName(sunshine_mode));
    if (sunshine_mode == SUNSHINE_FIXED) {
        fprintf(fp, "* \t ANNUAL_SUNSHINE_HOURS: %.1f h\n", annualSunshineHours);
    } else if (sunshine_mode == SUNSHINE_NETCDF) {
        fprintf(fp, "* \t SUNSHINE_FILE: %s\n", sunshine_file);
        fprintf(fp, "* \t SUNSHINE_VAR: %s\n", sunshine_var);
    }
    fprintf(fp, "* \t TEMPERATURE_CORRECTION: %d\n", temperatureCorrection);
    if (detailDate > 0) {
        fprintf(fp, "* \t DETAIL_DATE: %ld\n", detailDate);
    }
}

PanelLayout Estimate_Control::layout() const {
    PanelLayout l;
    l.panelLengthM = panelLength;
    l.panelWidthM = panelWidth;
    l.perPanelWattageW = panelWattage;
    l.mount = panelMount;
    l.maxSystemWattageW = maxSystemWattage;
    l.wattageLeewayW = wattageLeeway;
    l.countOverride = panelCount;
    return l;
}

double Estimate_Control::effectivePanelAzimuth() const {
    if (!isNA(panelAzimuth)) {
        return panelAzimuth;
    }
    if (isNA(lineAzimuth)) {
        return NA_VALUE;
    }
    return panelAzimuthFromLine(lineAzimuth, panelSide);
}
