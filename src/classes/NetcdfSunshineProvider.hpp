//  NetcdfSunshineProvider.hpp
//  SolarYield
//
//  Annual sunshine-hours climatology read from a NetCDF grid.
//
//  Expected layout: 1-D coordinate variables for latitude and longitude
//  and a 2-D data variable over (lat, lon) in either order. The value of
//  the grid cell nearest to the requested location is returned;
//  scale_factor / add_offset are applied and _FillValue / missing_value
//  cells are reported as unavailable.
//
#ifndef NetcdfSunshineProvider_hpp
#define NetcdfSunshineProvider_hpp

#include "SunshineProvider.hpp"

#include <string>

class SolarTrace;

class NetcdfSunshineProvider final : public SunshineProvider {
public:
    NetcdfSunshineProvider(const std::string &file,
                           const std::string &var_name,
                           const std::string &lat_name = "lat",
                           const std::string &lon_name = "lon",
                           SolarTrace *trace = nullptr);
    ~NetcdfSunshineProvider() override;

    NetcdfSunshineProvider(const NetcdfSunshineProvider &) = delete;
    NetcdfSunshineProvider &operator=(const NetcdfSunshineProvider &) = delete;

    /* false when the file could not be loaded; lookups then always fail. */
    bool isLoaded() const;

    bool annualSunshineHours(double lat_deg, double lon_deg, double &hours) const override;

    const char *name() const override { return "NETCDF"; }

private:
    struct Impl;
    Impl *impl_;
};

#endif /* NetcdfSunshineProvider_hpp */
