#include "gravsim/arch/native/renderer_native.hpp"
#include "gravsim/core/constants.hpp"
#include "gravsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace {
    // Surface colour of every body
    const sf::Color BodyColor(204, 178, 153);
}

Renderer::Renderer(int screenWidth, int screenHeight)
    : fontLoaded(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "gravsim");
    window.setVerticalSyncEnabled(true);

    if (!font.loadFromFile("assets/fonts/arial.ttf")) {
        std::cerr << "[Renderer] Failed to load font assets/fonts/arial.ttf, overlay disabled\n";
    } else {
        fontLoaded = true;
    }
    return window.isOpen();
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

sf::Vector2f Renderer::project(const Position& pos) const {
    // Origin at the window centre, +y up
    auto const px = static_cast<float>(screenWidth / 2.0 + SimulatorConstants::unitsToPixels(pos.x));
    auto const py = static_cast<float>(screenHeight / 2.0 - SimulatorConstants::unitsToPixels(pos.y));
    return {px, py};
}

void Renderer::renderBodies(const BodyRegistry& bodies) {
    PROFILE_SCOPE("Renderer::renderBodies");

    drawOrder.resize(bodies.size());
    std::iota(drawOrder.begin(), drawOrder.end(), 0);
    std::sort(drawOrder.begin(), drawOrder.end(), [&bodies](std::size_t a, std::size_t b) {
        return bodies.position(a).z < bodies.position(b).z;
    });

    sf::CircleShape circle;
    circle.setFillColor(BodyColor);
    for (std::size_t i : drawOrder) {
        float const radiusPixels = std::max(1.0F,
            static_cast<float>(SimulatorConstants::unitsToPixels(bodies.radius(i))));
        circle.setRadius(radiusPixels);
        circle.setOrigin(radiusPixels, radiusPixels);
        circle.setPosition(project(bodies.position(i)));
        window.draw(circle);
    }
}

void Renderer::renderHud(const HudInfo& info) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << info.fps << " FPS"
       << "   x" << std::setprecision(2) << info.timeScale
       << "   " << info.bodyCount << " bodies"
       << "   " << info.collisions << " collisions";
    if (info.paused) {
        ss << "   [paused]";
    }
    renderText(ss.str(), 10, 10, sf::Color::White);
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(16);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
