#include "sky_cutout/astrometry/wcs.hpp"
#include "sky_cutout/core/errors.hpp"

#include <cmath>
#include <string>

namespace sky_cutout::astrometry {

WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2) {
    WCS w;
    w.crval1 = crval1;
    w.crval2 = crval2;
    w.crpix1 = crpix1;
    w.crpix2 = crpix2;
    w.naxis1 = naxis1;
    w.naxis2 = naxis2;

    constexpr double D2R = M_PI / 180.0;
    double cos_r = std::cos(crota2 * D2R);
    double sin_r = std::sin(crota2 * D2R);

    w.cd1_1 =  cdelt1 * cos_r;
    w.cd1_2 = -cdelt2 * sin_r;
    w.cd2_1 =  cdelt1 * sin_r;
    w.cd2_2 =  cdelt2 * cos_r;

    return w;
}

WCS wcs_from_header(const io::FitsHeader& header, int naxis1, int naxis2) {
    auto ctype1 = header.get_string("CTYPE1");
    auto ctype2 = header.get_string("CTYPE2");
    if ((ctype1 && ctype1->find("TAN") == std::string::npos) ||
        (ctype2 && ctype2->find("TAN") == std::string::npos)) {
        throw FitsError("unsupported projection " + ctype1.value_or("?") + "/" +
                        ctype2.value_or("?"));
    }

    auto crval1 = header.get_double("CRVAL1");
    auto crval2 = header.get_double("CRVAL2");
    auto crpix1 = header.get_double("CRPIX1");
    auto crpix2 = header.get_double("CRPIX2");
    if (!crval1 || !crval2 || !crpix1 || !crpix2) {
        throw FitsError("header has no CRVAL/CRPIX keywords");
    }

    WCS w;
    auto cd1_1 = header.get_double("CD1_1");
    auto cd1_2 = header.get_double("CD1_2");
    auto cd2_1 = header.get_double("CD2_1");
    auto cd2_2 = header.get_double("CD2_2");
    auto cdelt1 = header.get_double("CDELT1");
    auto cdelt2 = header.get_double("CDELT2");

    if (cd1_1 || cd1_2 || cd2_1 || cd2_2) {
        w.crval1 = *crval1;
        w.crval2 = *crval2;
        w.crpix1 = *crpix1;
        w.crpix2 = *crpix2;
        w.cd1_1 = cd1_1.value_or(0.0);
        w.cd1_2 = cd1_2.value_or(0.0);
        w.cd2_1 = cd2_1.value_or(0.0);
        w.cd2_2 = cd2_2.value_or(0.0);
        w.naxis1 = naxis1;
        w.naxis2 = naxis2;
    } else if (cdelt1 && cdelt2 && (header.get_double("PC1_1") || header.get_double("PC2_2"))) {
        w.crval1 = *crval1;
        w.crval2 = *crval2;
        w.crpix1 = *crpix1;
        w.crpix2 = *crpix2;
        w.cd1_1 = *cdelt1 * header.get_double("PC1_1").value_or(1.0);
        w.cd1_2 = *cdelt1 * header.get_double("PC1_2").value_or(0.0);
        w.cd2_1 = *cdelt2 * header.get_double("PC2_1").value_or(0.0);
        w.cd2_2 = *cdelt2 * header.get_double("PC2_2").value_or(1.0);
        w.naxis1 = naxis1;
        w.naxis2 = naxis2;
    } else if (cdelt1 && cdelt2) {
        double rot = header.get_double("CROTA2").value_or(header.get_double("CROTA1").value_or(0.0));
        w = wcs_from_cdelt_crota(*crval1, *crval2, *crpix1, *crpix2,
                                 *cdelt1, *cdelt2, rot, naxis1, naxis2);
    } else {
        throw FitsError("header has neither CD nor CDELT keywords");
    }

    if (!w.valid()) {
        throw FitsError("degenerate WCS in header");
    }
    return w;
}

void apply_wcs(const WCS& wcs, io::FitsHeader& header) {
    header.set("CTYPE1", "RA---TAN");
    header.set("CTYPE2", "DEC--TAN");
    header.set("CUNIT1", "deg");
    header.set("CUNIT2", "deg");
    header.set("CRVAL1", wcs.crval1);
    header.set("CRVAL2", wcs.crval2);
    header.set("CRPIX1", wcs.crpix1);
    header.set("CRPIX2", wcs.crpix2);
    header.set("CD1_1", wcs.cd1_1);
    header.set("CD1_2", wcs.cd1_2);
    header.set("CD2_1", wcs.cd2_1);
    header.set("CD2_2", wcs.cd2_2);

    for (const char* key : {"CDELT1", "CDELT2", "CROTA1", "CROTA2",
                            "PC1_1", "PC1_2", "PC2_1", "PC2_2"}) {
        header.numeric_values.erase(key);
        header.int_values.erase(key);
    }
}

} // namespace sky_cutout::astrometry
