#ifndef GRAVSIM_COMPONENTS_BASIC_HPP
#define GRAVSIM_COMPONENTS_BASIC_HPP

#include <cstddef>
#include "gravsim/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Fixed at creation. Unit density, so value = 4/3 * pi * r^3.
    struct Mass {
        double value;
    };

    struct Radius {
        double value;
    };

    // Creation-order slot of a body in the BodyRegistry
    struct BodyIndex {
        std::size_t value;
    };

} // namespace Components

#endif
