#include "visualizer/visualizer_window.hpp"
#include "logger.hpp"

#include <SFML/Graphics.hpp>
#include <algorithm>

// Orb colour per engine state
static sf::Color stateColor(EngineState s) {
    switch (s) {
        case EngineState::Idle:       return sf::Color(70, 80, 110);
        case EngineState::Listening:  return sf::Color(60, 170, 255);
        case EngineState::Processing: return sf::Color(240, 190, 60);
        case EngineState::Speaking:   return sf::Color(90, 230, 150);
    }
    return sf::Color::White;
}

SfmlVisualizerWindow::SfmlVisualizerWindow(unsigned width, unsigned height, std::string title)
    : width_(width), height_(height), title_(std::move(title)) {}

SfmlVisualizerWindow::~SfmlVisualizerWindow() {
    close();
}

bool SfmlVisualizerWindow::open() {
    window_ = std::make_unique<sf::RenderWindow>(sf::VideoMode({width_, height_}), title_,
                                                 sf::Style::Titlebar | sf::Style::Close);
    if (!window_->isOpen()) {
        LOG_ERROR("VisualizerWindow", "Could not create " + std::to_string(width_) + "x" +
                  std::to_string(height_) + " window");
        window_.reset();
        return false;
    }
    // The animator paces the ticks
    window_->setVerticalSyncEnabled(false);
    LOG_PHASE("Visualizer window open", true);
    return true;
}

bool SfmlVisualizerWindow::draw(const AnimationFrame& frame) {
    if (!window_ || !window_->isOpen()) return false;

    // SFML 3 style: is<T>()
    while (auto evOpt = window_->pollEvent()) {
        if (evOpt->is<sf::Event::Closed>()) {
            window_->close();
            return false;
        }
    }

    const float cx = width_ / 2.f;
    const float cy = height_ / 2.f;
    const float base = std::min(cx, cy) * 0.55f;

    sf::Color core = stateColor(frame.state);

    // Outer halo, brighter while listening or speaking
    float haloR = base * frame.orb.scale * (1.2f + 0.3f * frame.orb.level);
    sf::CircleShape halo(haloR);
    halo.setOrigin({haloR, haloR});
    halo.setPosition({cx, cy});
    halo.setFillColor(sf::Color(core.r, core.g, core.b,
                                static_cast<std::uint8_t>(30 + 90 * frame.orb.glow)));

    float coreR = base * frame.orb.scale;
    sf::CircleShape orb(coreR);
    orb.setOrigin({coreR, coreR});
    orb.setPosition({cx, cy});
    orb.setFillColor(core);

    window_->clear(sf::Color(12, 12, 18));
    window_->draw(halo);
    window_->draw(orb);
    window_->display();
    return true;
}

void SfmlVisualizerWindow::close() {
    if (!window_) return;
    if (window_->isOpen()) window_->close();
    window_.reset();
    LOG_DEBUG("VisualizerWindow", "Window closed");
}
