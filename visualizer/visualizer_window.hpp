#pragma once
#include <memory>
#include <string>

#include "visualizer/visualizer_animator.hpp"

namespace sf { class RenderWindow; }

// ===========================================================
// SFML orb window
// Created, drawn and closed on the animator thread.
// ===========================================================
class SfmlVisualizerWindow : public VisualizerRenderer {
public:
    SfmlVisualizerWindow(unsigned width = 256, unsigned height = 256,
                         std::string title = "Cadence");
    ~SfmlVisualizerWindow() override;

    std::string name() const override { return "SFML window"; }
    bool open() override;
    bool draw(const AnimationFrame& frame) override;
    void close() override;

private:
    unsigned width_;
    unsigned height_;
    std::string title_;
    std::unique_ptr<sf::RenderWindow> window_;
};
