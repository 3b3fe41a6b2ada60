/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include "world/WorldState.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Delve {

// Save file envelope
constexpr const char* DELVE_SAVE_FORMAT = "DELVESAVE";
constexpr int DELVE_SAVE_VERSION = 1;

// SaveGame data structure for metadata access
struct SaveGameData {
    std::string saveName{};
    std::string timestamp{};
    uint64_t tick{0};
    size_t gnomeCount{0};
    int worldWidth{0};
    int worldHeight{0};
};

/**
 * SaveGameManager writes whole worlds to JSON save files and reads them back.
 *
 * Files live in <saveDirectory>/game_saves/ and look like
 *   {"format": "DELVESAVE", "version": 1, "savedAt": <unix seconds>, "world": {...}}
 *
 * Every operation reports failure through its return value; the reason is
 * kept in getLastError() and logged.
 */
class SaveGameManager {
public:
    ~SaveGameManager() = default;

    static SaveGameManager& Instance() {
        static SaveGameManager instance;
        return instance;
    }

    // Save a world to a file
    // Returns true if save was successful
    bool save(const std::string& saveFileName, const WorldState& state);

    // Save a world to a slot (creates a file with a standard naming convention)
    bool saveToSlot(int slotNumber, const WorldState& state);

    // Load a world from a file; older saves are backfilled
    // Returns true if load was successful, out is untouched otherwise
    bool load(const std::string& saveFileName, WorldState& out, int gnomeMaxHealth = 100);

    bool loadFromSlot(int slotNumber, WorldState& out, int gnomeMaxHealth = 100);

    bool deleteSave(const std::string& saveFileName);
    bool deleteSlot(int slotNumber);

    // Valid save files in the save directory, sorted by name
    std::vector<std::string> getSaveFiles() const;

    // Get information about a specific save file
    SaveGameData getSaveInfo(const std::string& saveFileName) const;

    std::vector<SaveGameData> getAllSaveInfo() const;

    bool saveExists(const std::string& saveFileName) const;
    bool slotExists(int slotNumber) const;

    // Checks the envelope only, not the world inside
    bool isValidSaveFile(const std::string& saveFileName) const;

    // Set the base directory for save files
    void setSaveDirectory(const std::string& directory);
    const std::string& getSaveDirectory() const { return m_saveDirectory; }

    const std::string& getLastError() const { return m_lastError; }

private:
    std::string m_saveDirectory{"res"};  // Default save directory
    std::string m_lastError{};

    // Helper methods
    std::string getSlotFileName(int slotNumber) const;
    std::string getFullSavePath(const std::string& saveFileName) const;
    bool ensureSaveDirectoryExists();
    void setError(const std::string& message);

    // Delete copy constructor and assignment operator
    SaveGameManager(const SaveGameManager&) = delete;
    SaveGameManager& operator=(const SaveGameManager&) = delete;

    SaveGameManager() = default;
};

} // namespace Delve

#endif  // SAVE_GAME_MANAGER_HPP
