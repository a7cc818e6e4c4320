#ifndef LIQUID_COMPONENTS_BASIC_HPP
#define LIQUID_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "liquid/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Entity position, the Position class from vector_math.hpp
    using Position = ::Position;

    // Angular components
    struct AngularPosition {
        double angle; // radians
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
