/**
 * @file RenameService.hpp
 * @brief Renames export files after the contacts found in their names.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/ContactIndex.hpp"
#include "domain/ExportFile.hpp"

namespace chatstamp::application {

/**
 * @class RenameService
 * @brief Resolves names, picks a collision-free target and moves (or simulates moving) each file.
 */
class RenameService {
public:
    struct Rename {
        std::string from; ///< Filename before.
        std::string to;   ///< Filename after (or that would be used in a dry run).
    };

    struct RenameResult {
        int candidates = 0; ///< Files whose name contains a digit or '@'.
        int renamed = 0;    ///< Moves performed, or that would be performed in a dry run.
        int unchanged = 0;  ///< Already carrying the resolved name.
        int unmatched = 0;  ///< No identifier resolved to a contact.
        std::vector<Rename> renames;
        std::vector<std::string> errors;
    };

    /**
     * @param index Must outlive the service.
     * @param dryRun Decide everything, move nothing.
     */
    RenameService(const domain::ContactIndex& index, bool dryRun, bool verbose);

    /**
     * @brief Processes the files in order. Move failures are recorded, not thrown.
     */
    RenameResult renameAll(const std::vector<domain::ExportFile>& files);

    /**
     * @brief Replaces <>:"/\|?* with '_', collapses '_' runs, trims '_' at both ends.
     */
    static std::string sanitizeFilename(const std::string& name);

    /** @brief Only names containing a digit or '@' can carry identifiers. */
    static bool isRenameCandidate(const std::string& filename);

private:
    const domain::ContactIndex& m_index;
    bool m_dryRun;
    bool m_verbose;

    // Paths taken or freed by earlier moves in this pass, so a dry run sees
    // the same directory state a real run would.
    std::set<std::filesystem::path> m_claimed;
    std::set<std::filesystem::path> m_vacated;

    bool isTaken(const std::filesystem::path& path) const;

    std::filesystem::path resolveCollision(const std::filesystem::path& current,
                                           const std::string& baseName) const;

    void processFile(const domain::ExportFile& file, RenameResult& result);
};

} // namespace chatstamp::application
