#pragma once
#include <string>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* CONFIG_FILE = "cadence_config.json";
inline constexpr const char* ERRORS_FILE = "errors.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// Folder holding errors.json, persona and script files.
// - Portable build (CADENCE_PORTABLE_ONLY): ./resources next to the executable
// - Otherwise: ./resources or ../resources from the working directory
std::string getResourcePath();

// Whole file as text from the resources folder. Empty if not found.
std::string loadTextResource(const std::string& filename);

// Resolve a configured file name: absolute or existing paths are kept,
// bare names are looked up in the resources folder.
std::string resolveResource(const std::string& filename);
