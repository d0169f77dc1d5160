/**
 * @file ChatStampApp.hpp
 * @brief Top-level run: export, rename after contacts, stamp message dates.
 */

#pragma once

#include <memory>
#include "domain/ContactStore.hpp"
#include "domain/ExportRunner.hpp"
#include "domain/FileMetadataWriter.hpp"
#include "domain/RunConfig.hpp"

namespace chatstamp::infrastructure {
class DateExtractor;
}

namespace chatstamp::app {

/**
 * @struct RunSummary
 * @brief End-of-run counters printed to the user.
 */
struct RunSummary {
    bool exportRan = false;
    int renamed = 0;     ///< Or "would rename" in a dry run.
    int unmatched = 0;
    int renameErrors = 0;
    int timestampsUpdated = 0;
    int withoutDates = 0;
    int timestampErrors = 0;
};

/**
 * @class ChatStampApp
 * @brief Orchestrates one run against the injected collaborators.
 */
class ChatStampApp {
public:
    struct Collaborators {
        std::shared_ptr<domain::ExportRunner> exporter;
        std::shared_ptr<domain::ContactStore> contacts; ///< May be null: renaming is then skipped.
        std::shared_ptr<domain::FileMetadataWriter> metadataWriter;
    };

    ChatStampApp(domain::RunConfig config, Collaborators collaborators);

    /**
     * @brief Runs every step and prints the summary.
     * @throws domain::SubprocessError if the export fails.
     * @throws domain::ConfigurationError if the date patterns fail to compile.
     */
    RunSummary Run();

private:
    void printConfiguration() const;
    void runExport(RunSummary& summary);
    void renameFiles(RunSummary& summary);
    void updateTimestamps(const infrastructure::DateExtractor& extractor, RunSummary& summary);
    void printSummary(const RunSummary& summary) const;

    domain::RunConfig m_config;
    Collaborators m_collaborators;
};

} // namespace chatstamp::app
