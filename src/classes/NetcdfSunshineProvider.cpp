#include "NetcdfSunshineProvider.hpp"

#include "SolarTrace.hpp"

#include <netcdf.h>

#include <cmath>
#include <vector>

namespace {

static std::string ncStrError(int status)
{
    const char *msg = nc_strerror(status);
    return msg ? std::string(msg) : std::string("unknown netcdf error");
}

static bool ncGetAttDouble(int ncid, int varid, const char *name, double &out_val)
{
    const int rc = nc_get_att_double(ncid, varid, name, &out_val);
    return rc == NC_NOERR;
}

/* Fill value netCDF writes for unwritten cells when a variable has no _FillValue. */
static bool ncDefaultFill(nc_type type, double &out_val)
{
    switch (type) {
        case NC_BYTE:   out_val = (double)NC_FILL_BYTE; return true;
        case NC_SHORT:  out_val = (double)NC_FILL_SHORT; return true;
        case NC_INT:    out_val = (double)NC_FILL_INT; return true;
        case NC_FLOAT:  out_val = (double)NC_FILL_FLOAT; return true;
        case NC_DOUBLE: out_val = (double)NC_FILL_DOUBLE; return true;
        case NC_UBYTE:  out_val = (double)NC_FILL_UBYTE; return true;
        case NC_USHORT: out_val = (double)NC_FILL_USHORT; return true;
        case NC_UINT:   out_val = (double)NC_FILL_UINT; return true;
        case NC_INT64:  out_val = (double)NC_FILL_INT64; return true;
        case NC_UINT64: out_val = (double)NC_FILL_UINT64; return true;
        default:        return false;
    }
}

/* Signed smallest difference a - b in degrees of longitude, [-180, 180]. */
static double lonDelta(double a, double b)
{
    double d = std::fmod(a - b, 360.0);
    if (d > 180.0) {
        d -= 360.0;
    } else if (d < -180.0) {
        d += 360.0;
    }
    return d;
}

} // namespace

struct NetcdfSunshineProvider::Impl {
    std::string file;
    std::string var_name;
    std::string lat_name;
    std::string lon_name;
    SolarTrace *trace = nullptr;

    bool loaded = false;
    bool lat_first = true;    /* data dims are (lat, lon) */

    std::vector<double> lat;
    std::vector<double> lon;
    std::vector<double> values;

    bool has_scale = false;
    bool has_offset = false;
    double scale = 1.0;
    double offset = 0.0;
    bool has_fill = false;
    bool has_missing = false;
    double fill = 0.0;
    double missing = 0.0;

    void fail(const char *what, int rc)
    {
        tracef(trace, TRACE_NOTICE, "sunshine file %s: %s (%s).",
               file.c_str(), what, rc == NC_NOERR ? "layout" : ncStrError(rc).c_str());
    }

    bool readCoord1d(int ncid, const std::string &name, std::vector<double> &out, int &dimid)
    {
        int varid = -1;
        int rc = nc_inq_varid(ncid, name.c_str(), &varid);
        if (rc != NC_NOERR) {
            fail("coordinate variable not found", rc);
            return false;
        }
        int ndims = 0;
        rc = nc_inq_varndims(ncid, varid, &ndims);
        if (rc != NC_NOERR || ndims != 1) {
            fail("coordinate variable must be 1-D", rc);
            return false;
        }
        rc = nc_inq_vardimid(ncid, varid, &dimid);
        if (rc != NC_NOERR) {
            fail("nc_inq_vardimid failed for coordinate", rc);
            return false;
        }
        size_t len = 0;
        rc = nc_inq_dimlen(ncid, dimid, &len);
        if (rc != NC_NOERR || len == 0) {
            fail("empty coordinate dimension", rc);
            return false;
        }
        out.assign(len, 0.0);
        rc = nc_get_var_double(ncid, varid, out.data());
        if (rc != NC_NOERR) {
            fail("failed to read coordinate variable", rc);
            return false;
        }
        return true;
    }

    bool load()
    {
        int ncid = -1;
        int rc = nc_open(file.c_str(), NC_NOWRITE, &ncid);
        if (rc != NC_NOERR) {
            fail("cannot open", rc);
            return false;
        }

        int lat_dim = -1;
        int lon_dim = -1;
        if (!readCoord1d(ncid, lat_name, lat, lat_dim) || !readCoord1d(ncid, lon_name, lon, lon_dim)) {
            nc_close(ncid);
            return false;
        }

        int varid = -1;
        rc = nc_inq_varid(ncid, var_name.c_str(), &varid);
        if (rc != NC_NOERR) {
            fail("sunshine variable not found", rc);
            nc_close(ncid);
            return false;
        }
        int ndims = 0;
        rc = nc_inq_varndims(ncid, varid, &ndims);
        if (rc != NC_NOERR || ndims != 2) {
            fail("sunshine variable must be 2-D (lat/lon)", rc);
            nc_close(ncid);
            return false;
        }
        int dimids[2] = {-1, -1};
        rc = nc_inq_vardimid(ncid, varid, dimids);
        if (rc != NC_NOERR) {
            fail("nc_inq_vardimid failed", rc);
            nc_close(ncid);
            return false;
        }
        if (dimids[0] == lat_dim && dimids[1] == lon_dim) {
            lat_first = true;
        } else if (dimids[0] == lon_dim && dimids[1] == lat_dim) {
            lat_first = false;
        } else {
            fail("sunshine variable dims do not match the coordinates", NC_NOERR);
            nc_close(ncid);
            return false;
        }

        values.assign(lat.size() * lon.size(), 0.0);
        rc = nc_get_var_double(ncid, varid, values.data());
        if (rc != NC_NOERR) {
            fail("failed to read sunshine variable", rc);
            nc_close(ncid);
            return false;
        }

        has_scale = ncGetAttDouble(ncid, varid, "scale_factor", scale);
        has_offset = ncGetAttDouble(ncid, varid, "add_offset", offset);
        has_fill = ncGetAttDouble(ncid, varid, "_FillValue", fill);
        if (!has_fill) {
            nc_type type = NC_NAT;
            rc = nc_inq_vartype(ncid, varid, &type);
            if (rc != NC_NOERR) {
                fail("nc_inq_vartype failed", rc);
                nc_close(ncid);
                return false;
            }
            has_fill = ncDefaultFill(type, fill);
        }
        has_missing = ncGetAttDouble(ncid, varid, "missing_value", missing);

        nc_close(ncid);
        tracef(trace, TRACE_DEBUG, "sunshine grid %s:%s loaded (%zu lat x %zu lon)",
               file.c_str(), var_name.c_str(), lat.size(), lon.size());
        return true;
    }

    size_t nearestLat(double lat_deg) const
    {
        size_t best = 0;
        double best_d = std::fabs(lat[0] - lat_deg);
        for (size_t i = 1; i < lat.size(); i++) {
            const double d = std::fabs(lat[i] - lat_deg);
            if (d < best_d) {
                best_d = d;
                best = i;
            }
        }
        return best;
    }

    size_t nearestLon(double lon_deg) const
    {
        size_t best = 0;
        double best_d = std::fabs(lonDelta(lon[0], lon_deg));
        for (size_t i = 1; i < lon.size(); i++) {
            const double d = std::fabs(lonDelta(lon[i], lon_deg));
            if (d < best_d) {
                best_d = d;
                best = i;
            }
        }
        return best;
    }
};

NetcdfSunshineProvider::NetcdfSunshineProvider(const std::string &file,
                                               const std::string &var_name,
                                               const std::string &lat_name,
                                               const std::string &lon_name,
                                               SolarTrace *trace)
{
    impl_ = new Impl();
    impl_->file = file;
    impl_->var_name = var_name;
    impl_->lat_name = lat_name;
    impl_->lon_name = lon_name;
    impl_->trace = trace;
    impl_->loaded = impl_->load();
}

NetcdfSunshineProvider::~NetcdfSunshineProvider()
{
    delete impl_;
    impl_ = nullptr;
}

bool NetcdfSunshineProvider::isLoaded() const
{
    return impl_->loaded;
}

bool NetcdfSunshineProvider::annualSunshineHours(double lat_deg, double lon_deg, double &hours) const
{
    if (!impl_->loaded || isNA(lat_deg) || isNA(lon_deg)) {
        return false;
    }
    const size_t i = impl_->nearestLat(lat_deg);
    const size_t j = impl_->nearestLon(lon_deg);
    const size_t idx = impl_->lat_first ? (i * impl_->lon.size() + j) : (j * impl_->lat.size() + i);

    const double raw = impl_->values[idx];
    if (!std::isfinite(raw)) {
        return false;
    }
    if (impl_->has_fill && raw == impl_->fill) {
        return false;
    }
    if (impl_->has_missing && raw == impl_->missing) {
        return false;
    }

    double v = raw;
    if (impl_->has_scale) {
        v *= impl_->scale;
    }
    if (impl_->has_offset) {
        v += impl_->offset;
    }
    if (!std::isfinite(v) || !(v > 0.0) || v > kMaxAnnualSunshineHours) {
        return false;
    }
    hours = v;
    return true;
}
