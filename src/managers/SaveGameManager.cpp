/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include "world/WorldSerializer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace Delve {

namespace {

constexpr const char* SAVE_EXTENSION = ".json";

// Reads a save file and checks its envelope
bool readEnvelope(const std::string &fullPath, JsonValue &root,
                  std::string &error) {
  JsonReader reader;
  if (!reader.loadFromFile(fullPath)) {
    error = "Could not parse " + fullPath + ": " + reader.getLastError();
    return false;
  }
  root = reader.getRoot();
  const JsonValue &doc = root;

  if (!doc.isObject()) {
    error = "Save file is not a JSON object: " + fullPath;
    return false;
  }
  const JsonValue &format = doc["format"];
  if (!format.isString() || format.asString() != DELVE_SAVE_FORMAT) {
    error = "Not a save file (bad format tag): " + fullPath;
    return false;
  }
  // Saves from before versioning are treated as version 1
  const int version = doc["version"].isNumber() ? doc["version"].asInt() : 1;
  if (version < 1 || version > DELVE_SAVE_VERSION) {
    error = "Unsupported save version " + std::to_string(version) + ": " + fullPath;
    return false;
  }
  if (!doc["world"].isObject()) {
    error = "Save file has no world: " + fullPath;
    return false;
  }
  return true;
}

std::string formatTimestamp(time_t timestamp) {
  std::tm timeinfo;
#ifdef _WIN32
  localtime_s(&timeinfo, &timestamp);
#else
  localtime_r(&timestamp, &timeinfo);
#endif
  char buffer[80];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return buffer;
}

} // namespace

bool SaveGameManager::save(const std::string &saveFileName,
                           const WorldState &state) {
  if (!ensureSaveDirectoryExists()) {
    setError("Failed to ensure save directory exists: " + m_saveDirectory);
    return false;
  }

  const std::string fullPath = getFullSavePath(saveFileName);

  JsonValue root(JsonObject{});
  root["format"] = JsonValue(DELVE_SAVE_FORMAT);
  root["version"] = JsonValue(DELVE_SAVE_VERSION);
  root["savedAt"] = JsonValue(static_cast<uint64_t>(
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())));
  root["world"] = WorldSerializer::toJson(state);

  // Write beside the target first so a failed write never eats an old save
  const std::string tempPath = fullPath + ".tmp";
  try {
    {
      std::ofstream file(tempPath, std::ios::out | std::ios::trunc);
      if (!file.is_open()) {
        setError("Could not open file " + tempPath + " for writing!");
        return false;
      }
      file << root.toString();
      if (!file.good()) {
        setError("Failed writing save data to " + tempPath);
        return false;
      }
    }
    std::filesystem::rename(tempPath, fullPath);
  } catch (const std::filesystem::filesystem_error &e) {
    setError("Error saving game: " + std::string(e.what()));
    std::error_code ec;
    std::filesystem::remove(tempPath, ec);
    return false;
  }

  SAVEGAME_INFO("Save successful: " + saveFileName + " (tick " +
                std::to_string(state.tick) + ")");
  return true;
}

bool SaveGameManager::saveToSlot(int slotNumber, const WorldState &state) {
  if (slotNumber < 1) {
    setError("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }

  return save(getSlotFileName(slotNumber), state);
}

bool SaveGameManager::load(const std::string &saveFileName, WorldState &out,
                           int gnomeMaxHealth) {
  const std::string fullPath = getFullSavePath(saveFileName);
  if (!std::filesystem::exists(fullPath)) {
    setError("Save file does not exist: " + saveFileName);
    return false;
  }

  JsonValue root;
  std::string error;
  if (!readEnvelope(fullPath, root, error)) {
    setError(error);
    return false;
  }

  const JsonValue &doc = root;
  if (!WorldSerializer::fromJson(doc["world"], out, error, gnomeMaxHealth)) {
    setError("Invalid world in " + saveFileName + ": " + error);
    return false;
  }

  SAVEGAME_INFO("Game loaded: " + saveFileName);
  return true;
}

bool SaveGameManager::loadFromSlot(int slotNumber, WorldState &out,
                                   int gnomeMaxHealth) {
  if (slotNumber < 1) {
    setError("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }

  return load(getSlotFileName(slotNumber), out, gnomeMaxHealth);
}

bool SaveGameManager::deleteSave(const std::string &saveFileName) {
  try {
    std::string fullPath = getFullSavePath(saveFileName);
    if (std::filesystem::exists(fullPath)) {
      std::filesystem::remove(fullPath);
      SAVEGAME_INFO("Deleted save: " + saveFileName);
      return true;
    }
    setError("Save file does not exist: " + fullPath);
    return false;
  } catch (const std::filesystem::filesystem_error &e) {
    setError("Error deleting save file: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::deleteSlot(int slotNumber) {
  if (slotNumber < 1) {
    setError("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }

  return deleteSave(getSlotFileName(slotNumber));
}

std::vector<std::string> SaveGameManager::getSaveFiles() const {
  std::vector<std::string> saveFiles;
  const std::string savePath = m_saveDirectory + "/game_saves";

  if (!std::filesystem::exists(savePath) ||
      !std::filesystem::is_directory(savePath)) {
    return saveFiles;
  }

  try {
    for (const auto &entry : std::filesystem::directory_iterator(savePath)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::filesystem::path filePath = entry.path();
      std::string extension = filePath.extension().string();
      std::transform(extension.begin(), extension.end(), extension.begin(),
                     [](unsigned char c) { return std::tolower(c); });

      if (extension == SAVE_EXTENSION &&
          isValidSaveFile(filePath.filename().string())) {
        saveFiles.push_back(filePath.filename().string());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error listing save files: " + std::string(e.what()));
  }

  // directory_iterator order is unspecified
  std::sort(saveFiles.begin(), saveFiles.end());
  return saveFiles;
}

SaveGameData
SaveGameManager::getSaveInfo(const std::string &saveFileName) const {
  SaveGameData info;
  info.saveName = saveFileName;

  const std::string fullPath = getFullSavePath(saveFileName);
  if (!std::filesystem::exists(fullPath)) {
    return info;
  }

  JsonValue root;
  std::string error;
  if (!readEnvelope(fullPath, root, error)) {
    SAVEGAME_ERROR("Invalid save file format when extracting info: " + error);
    return info;
  }

  const JsonValue &doc = root;
  if (doc["savedAt"].isNumber()) {
    info.timestamp =
        formatTimestamp(static_cast<time_t>(doc["savedAt"].asUInt64()));
  }

  // Summary fields straight from the document, no full world rebuild
  const JsonValue &world = doc["world"];
  if (world["tick"].isNumber()) {
    info.tick = world["tick"].asUInt64();
  }
  if (world["worldWidth"].isNumber()) {
    info.worldWidth = world["worldWidth"].asInt();
  }
  if (world["worldHeight"].isNumber()) {
    info.worldHeight = world["worldHeight"].asInt();
  }
  info.gnomeCount = world["gnomes"].size();

  return info;
}

std::vector<SaveGameData> SaveGameManager::getAllSaveInfo() const {
  std::vector<SaveGameData> saveInfoList;
  for (const auto &file : getSaveFiles()) {
    saveInfoList.push_back(getSaveInfo(file));
  }
  return saveInfoList;
}

bool SaveGameManager::saveExists(const std::string &saveFileName) const {
  return std::filesystem::exists(getFullSavePath(saveFileName));
}

bool SaveGameManager::slotExists(int slotNumber) const {
  if (slotNumber < 1) {
    return false;
  }
  return saveExists(getSlotFileName(slotNumber));
}

bool SaveGameManager::isValidSaveFile(const std::string &saveFileName) const {
  const std::string fullPath = getFullSavePath(saveFileName);
  if (!std::filesystem::exists(fullPath)) {
    return false;
  }

  JsonValue root;
  std::string error;
  return readEnvelope(fullPath, root, error);
}

void SaveGameManager::setSaveDirectory(const std::string &directory) {
  m_saveDirectory = directory;

  // Ensure the game_saves subdirectory exists right away
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_WARN("Save directory not usable yet: " + directory);
  }
}

// Private helper methods
std::string SaveGameManager::getSlotFileName(int slotNumber) const {
  return "save_slot_" + std::to_string(slotNumber) + SAVE_EXTENSION;
}

std::string
SaveGameManager::getFullSavePath(const std::string &saveFileName) const {
  return m_saveDirectory + "/game_saves/" + saveFileName;
}

bool SaveGameManager::ensureSaveDirectoryExists() {
  const std::string savePath = m_saveDirectory + "/game_saves";
  std::error_code ec;
  if (std::filesystem::is_directory(savePath, ec)) {
    return true;
  }

  std::filesystem::create_directories(savePath, ec);
  if (ec) {
    setError("Failed to create save directory " + savePath + ": " +
             ec.message());
    return false;
  }
  SAVEGAME_INFO("Created save directory: " + savePath);
  return true;
}

void SaveGameManager::setError(const std::string &message) {
  m_lastError = message;
  SAVEGAME_ERROR(message);
}

} // namespace Delve
