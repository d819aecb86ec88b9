#pragma once
#include <filesystem>
#include <memory>

#include "bootstrap_config.hpp"
#include "engine/conversation_engine.hpp"
#include "visualizer/visualizer_animator.hpp"

// Config, error catalog, log level and device listing. false only when the
// settings do not validate.
bool runBootstrapChecks(const std::filesystem::path& configPath,
                        bootstrap_config::AppSettings& out,
                        EngineError* err);

// Wires devices, codec, model, wake gate, persona and supervisor link from
// the settings into an engine. nullptr with err on any construction failure.
std::unique_ptr<ConversationEngine> buildEngine(const bootstrap_config::AppSettings& settings,
                                                EngineError* err);

// nullptr when the visualizer is disabled.
std::unique_ptr<VisualizerAnimator> buildVisualizer(const bootstrap_config::AppSettings& settings,
                                                    const ConversationEngine& engine);

// Persona by preset name or JSON file path.
bool resolvePersona(const std::string& nameOrFile, PersonaProfile& out, EngineError* err);
