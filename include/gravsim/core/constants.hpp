#ifndef GRAVSIM_CONSTANTS_HPP
#define GRAVSIM_CONSTANTS_HPP

namespace SimulatorConstants {

    // Truly global constants
    extern const double Pi;
    extern const double DefaultG;              // Simulation units, not SI
    extern const double DefaultMinSeparation;  // Below this a pair has no usable direction
    extern const double BodyDensity;

    // Display constants
    extern const unsigned int ScreenLength;
    extern const double PixelsPerUnit;

    /**
     * @brief Mass of a sphere of the given radius at BodyDensity.
     */
    double sphereMass(double radius);

    // Utility conversions for the viewer
    double unitsToPixels(double units);
    double pixelsToUnits(double pixels);
}

#endif // GRAVSIM_CONSTANTS_HPP
