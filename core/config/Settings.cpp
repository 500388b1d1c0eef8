#include "core/config/Settings.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

/**
 * @file Settings.cpp
 * @brief Load/create application settings backed by a JSON file.
 */

std::filesystem::path Settings::defaultSettingsPath() {
  // Resolve default settings path; Windows uses APPDATA, Linux uses HOME.
#ifdef _WIN32
  const char* appdata = std::getenv("APPDATA");
  std::filesystem::path base = appdata ? appdata : std::filesystem::current_path();
  return base / "TicketRandomizer" / "settings.json";
#else
  const char* home = std::getenv("HOME");
  std::filesystem::path base = home ? (std::filesystem::path(home) / ".config") : std::filesystem::current_path();
  return base / "TicketRandomizer" / "settings.json";
#endif
}

Settings Settings::loadFrom(const std::filesystem::path& path) {
  Settings settings;
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    spdlog::info("Settings file not found at {}, creating default.", path.string());
    if (!settings.saveTo(path)) {
      spdlog::warn("Using in-memory default settings");
    }
    return settings;
  }

  try {
    nlohmann::json j;
    ifs >> j;
    const Settings defaults;
    settings.capitals = j.value("capitals", defaults.capitals);
    settings.lowercase = j.value("lowercase", defaults.lowercase);
    settings.digits = j.value("digits", defaults.digits);
    settings.specials = j.value("specials", defaults.specials);
    settings.excludedChars = j.value("excludedChars", defaults.excludedChars);
    settings.ticketCount = j.value("ticketCount", defaults.ticketCount);
    settings.ticketLength = j.value("ticketLength", defaults.ticketLength);
    settings.lastDirectory = j.value("lastDirectory", defaults.lastDirectory);
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("Failed to parse settings file {}: {}", path.string(), e.what());
    // Fallback to defaults and write them back to recover a broken file
    settings = Settings();
    ifs.close();
    if (!settings.saveTo(path)) {
      spdlog::warn("Using in-memory default settings");
    }
  }
  return settings;
}

bool Settings::save() const {
  return saveTo(defaultSettingsPath());
}

bool Settings::saveTo(const std::filesystem::path& path) const {
  nlohmann::json j;
  j["capitals"] = capitals;
  j["lowercase"] = lowercase;
  j["digits"] = digits;
  j["specials"] = specials;
  j["excludedChars"] = excludedChars;
  j["ticketCount"] = ticketCount;
  j["ticketLength"] = ticketLength;
  j["lastDirectory"] = lastDirectory;

  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error("Failed to create settings directory {}: {}", path.parent_path().string(), ec.message());
    }
  }
  std::ofstream ofs(path);
  if (!ofs.is_open()) {
    spdlog::error("Failed to save settings file {}", path.string());
    return false;
  }
  ofs << j.dump(2); // Pretty print with 2 spaces
  return static_cast<bool>(ofs);
}

TicketForm Settings::toForm() const {
  TicketForm form;
  form.charset.capitals = capitals;
  form.charset.lowercase = lowercase;
  form.charset.digits = digits;
  form.charset.specials = specials;
  form.charset.excluded = excludedChars;
  form.ticketCount = ticketCount;
  form.ticketLength = ticketLength;
  return form;
}

void Settings::updateFromForm(const TicketForm& form) {
  capitals = form.charset.capitals;
  lowercase = form.charset.lowercase;
  digits = form.charset.digits;
  specials = form.charset.specials;
  excludedChars = form.charset.excluded;
  ticketCount = form.ticketCount;
  ticketLength = form.ticketLength;
}
