#undef NDEBUG
#include "Estimate_Control.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

static const char *kCtrlFile = "test_estimate_control.cfg";

static void writeFile(const char *fn, const char *text)
{
    FILE *fp = fopen(fn, "w");
    assert(fp != NULL);
    fputs(text, fp);
    fclose(fp);
}

void test_defaults() {
    Estimate_Control ctrl;
    assert(isNA(ctrl.latitude));
    assert(ctrl.panelLength == 2.0 && ctrl.panelWidth == 1.0);
    assert(ctrl.panelWattage == 400.0);
    assert(ctrl.panelTilt == 90.0);
    assert(ctrl.maxSystemWattage == 2000.0 && ctrl.wattageLeeway == 200.0);
    assert(ctrl.electricityPrice == 0.32);
    assert(ctrl.sunshine_mode == SUNSHINE_CLIMATE);
    assert(strcmp(ctrl.sunshine_var, "sunshine_hours") == 0);
    assert(ctrl.panelSide == SIDE_LEFT);
    assert(ctrl.layout().countOverride < 0);
    std::cout << "[PASS] Control defaults.\n";
}

void test_read_file() {
    writeFile(kCtrlFile,
              "# balcony in Berlin\n"
              "LATITUDE 52.52\n"
              "longitude 13.405\n"
              "\n"
              "LINE_LENGTH 6.5\n"
              "LINE_AZIMUTH 90\n"
              "PANEL_SIDE right\n"
              "PANEL_MOUNT WIDTH\n"
              "PANEL_WATTAGE 410\n"
              "PANEL_TILT 70\n"
              "ELECTRICITY_PRICE 0.40\n"
              "SUNSHINE_MODE netcdf\n"
              "SUNSHINE_FILE data/sunshine.nc\n"
              "SUNSHINE_VAR ssd\n"
              "TEMPERATURE_CORRECTION 1\n"
              "DETAIL_DATE 20240621\n"
              "RAILING_HEIGHT 1.1\n");

    Estimate_Control ctrl;
    assert(ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(ctrl.latitude == 52.52);
    assert(ctrl.longitude == 13.405);
    assert(ctrl.lineLength == 6.5);
    assert(ctrl.panelSide == SIDE_RIGHT);
    assert(ctrl.panelMount == MOUNT_WIDTH);
    assert(ctrl.panelWattage == 410.0);
    assert(ctrl.panelTilt == 70.0);
    assert(ctrl.electricityPrice == 0.40);
    assert(ctrl.sunshine_mode == SUNSHINE_NETCDF);
    /* no directory in the control file name, the path stays as written */
    assert(strcmp(ctrl.sunshine_file, "data/sunshine.nc") == 0);
    assert(strcmp(ctrl.sunshine_var, "ssd") == 0);
    assert(ctrl.temperatureCorrection == 1);
    assert(ctrl.detailDate == 20240621L);
    assert(ctrl.NumUnknown == 1);

    assert(ctrl.effectivePanelAzimuth() == 180.0);
    const PanelLayout l = ctrl.layout();
    assert(l.mount == MOUNT_WIDTH && l.perPanelWattageW == 410.0);
    std::cout << "[PASS] Control file keys.\n";
}

void test_invalid_values_keep_defaults() {
    writeFile(kCtrlFile,
              "SUNSHINE_MODE SATELLITE\n"
              "PANEL_SIDE up\n"
              "PANEL_MOUNT diagonal\n"
              "TEMPERATURE_CORRECTION 7\n"
              "PANEL_AZIMUTH 200\n"
              "PANEL_COUNT 3\n"
              "PANEL_TILT 120\n");

    Estimate_Control ctrl;
    assert(ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(ctrl.sunshine_mode == SUNSHINE_CLIMATE);
    assert(ctrl.panelSide == SIDE_LEFT);
    assert(ctrl.panelMount == MOUNT_LENGTH);
    assert(ctrl.temperatureCorrection == 0);
    assert(ctrl.effectivePanelAzimuth() == 200.0);
    assert(ctrl.layout().countOverride == 3);
    /* geometry is passed through for the engine to reject */
    assert(ctrl.panelTilt == 120.0);
    assert(ctrl.NumUnknown == 0);
    std::cout << "[PASS] Invalid mode strings keep the defaults.\n";
}

void test_negative_panel_settings_reach_validation() {
    writeFile(kCtrlFile, "LINE_LENGTH 6\nPANEL_COUNT -5\n");
    Estimate_Control count_ctrl;
    assert(count_ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(count_ctrl.panelCount == -5);
    std::string field;
    assert(!validatePanelLayout(count_ctrl.lineLength, count_ctrl.layout(), field));
    assert(field == "panelCount");

    writeFile(kCtrlFile, "LINE_LENGTH 6\nPANEL_LENGTH -2\n");
    Estimate_Control length_ctrl;
    assert(length_ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(length_ctrl.panelLength == -2.0);
    assert(!validatePanelLayout(length_ctrl.lineLength, length_ctrl.layout(), field));
    assert(field == "panelLengthM");

    writeFile(kCtrlFile, "LINE_LENGTH -6\n");
    Estimate_Control line_ctrl;
    assert(line_ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(!validatePanelLayout(line_ctrl.lineLength, line_ctrl.layout(), field));
    assert(field == "lineLengthM");

    /* no PANEL_COUNT key leaves the override unset */
    writeFile(kCtrlFile, "LINE_LENGTH 6\n");
    Estimate_Control unset_ctrl;
    assert(unset_ctrl.read(kCtrlFile) == ERRSUCCESS);
    assert(validatePanelLayout(unset_ctrl.lineLength, unset_ctrl.layout(), field));
    assert(buildPanelArray(unset_ctrl.lineLength, unset_ctrl.layout()).panelCount == 3);
    std::cout << "[PASS] Negative panel settings reach validation unchanged.\n";
}

void test_relative_sunshine_path() {
    writeFile(kCtrlFile, "SUNSHINE_MODE NETCDF\nSUNSHINE_FILE grid.nc\n");
    Estimate_Control ctrl;
    assert(ctrl.read("./test_estimate_control.cfg") == ERRSUCCESS);
    assert(strcmp(ctrl.sunshine_file, "./grid.nc") == 0);

    writeFile(kCtrlFile, "SUNSHINE_FILE /abs/grid.nc\n");
    Estimate_Control abs_ctrl;
    assert(abs_ctrl.read("./test_estimate_control.cfg") == ERRSUCCESS);
    assert(strcmp(abs_ctrl.sunshine_file, "/abs/grid.nc") == 0);
    std::cout << "[PASS] Sunshine file resolved against the control file.\n";
}

void test_missing_file() {
    Estimate_Control ctrl;
    assert(ctrl.read("does_not_exist.cfg") == ERRFileIO);
    std::cout << "[PASS] Missing control file reported.\n";
}

void test_print_settings() {
    Estimate_Control ctrl;
    ctrl.latitude = 51.0;
    ctrl.longitude = 9.0;
    FILE *fp = tmpfile();
    assert(fp != NULL);
    ctrl.print(fp);
    rewind(fp);
    char line[MAXLEN];
    assert(fgets(line, MAXLEN, fp) != NULL);
    assert(strncmp(line, "* \t LATITUDE: 51.0", 18) == 0);
    fclose(fp);
    std::cout << "[PASS] Settings echo.\n";
}

int main() {
    std::cout << "=== Control file tests ===\n";
    test_defaults();
    test_read_file();
    test_invalid_values_keep_defaults();
    test_negative_panel_settings_reach_validation();
    test_relative_sunshine_path();
    test_missing_file();
    test_print_settings();
    remove(kCtrlFile);
    std::cout << "All tests passed.\n";
    return 0;
}
