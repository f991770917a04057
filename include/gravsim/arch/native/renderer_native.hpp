/**
 * @file renderer_native.hpp
 * @brief Body rendering using SFML
 *
 * Bodies are drawn as filled circles, projected orthographically onto the
 * x-y plane and painted back to front along z.
 */

#pragma once

#include <string>
#include <vector>
#include <SFML/Graphics.hpp>

#include "gravsim/core/body_registry.hpp"

/**
 * @class Renderer
 * @brief Owns the window and draws bodies and a status overlay
 */
class Renderer {
public:
    /**
     * @brief Snapshot of driver state shown in the overlay
     */
    struct HudInfo {
        float fps = 0.0F;
        double timeScale = 1.0;
        bool paused = false;
        std::size_t bodyCount = 0;
        std::size_t collisions = 0;
    };

    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the window and tries to load the overlay font
     * @return true if the window is open; a missing font only disables text
     */
    bool init();

    void clear();
    void present();

    void renderBodies(const BodyRegistry& bodies);
    void renderHud(const HudInfo& info);

    sf::RenderWindow& getWindow() { return window; }

private:
    void renderText(const std::string& text, int x, int y, sf::Color color);

    sf::Vector2f project(const Position& pos) const;

    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded;
    int screenWidth;
    int screenHeight;

    // Reused between frames: body indices sorted far to near
    std::vector<std::size_t> drawOrder;
};
