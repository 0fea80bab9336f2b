#ifndef PLASTER_COLORS_HPP_INCLUDED
#define PLASTER_COLORS_HPP_INCLUDED

#include <glm/vec4.hpp>

namespace plaster::colors
{
    inline constexpr glm::vec4 BLACK  = {0.0f, 0.0f, 0.0f, 1.0f};
    inline constexpr glm::vec4 BLUE   = {0.0f, 0.0f, 1.0f, 1.0f};
    inline constexpr glm::vec4 GREEN  = {0.0f, 1.0f, 0.0f, 1.0f};
    inline constexpr glm::vec4 CYAN   = {0.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr glm::vec4 RED    = {1.0f, 0.0f, 0.0f, 1.0f};
    inline constexpr glm::vec4 PURPLE = {1.0f, 0.0f, 1.0f, 1.0f};
    inline constexpr glm::vec4 YELLOW = {1.0f, 1.0f, 0.0f, 1.0f};
    inline constexpr glm::vec4 WHITE  = {1.0f, 1.0f, 1.0f, 1.0f};

} // namespace plaster::colors

#endif // PLASTER_COLORS_HPP_INCLUDED
