#include "gravsim/core/constants.hpp"
#include <cmath>

namespace SimulatorConstants {

    const double Pi                   = 3.14159265358979323846;
    const double DefaultG             = 1.0;
    const double DefaultMinSeparation = 1e-9;
    const double BodyDensity          = 1.0;

    // Display
    const unsigned int ScreenLength = 800;
    const double PixelsPerUnit      = 40.0;

    double sphereMass(double radius) {
        return BodyDensity * 4.0 * Pi * std::pow(radius, 3.0) / 3.0;
    }

    double unitsToPixels(double units) {
        return units * PixelsPerUnit;
    }

    double pixelsToUnits(double pixels) {
        return pixels / PixelsPerUnit;
    }

} // namespace SimulatorConstants
