/**
 * @file ChatStampApp.cpp
 * @brief Implementation of the ChatStampApp class.
 */
#include "app/ChatStampApp.hpp"

#include "application/ContactIndexService.hpp"
#include "application/RenameService.hpp"
#include "application/TimestampService.hpp"
#include "infrastructure/DateExtractor.hpp"
#include "infrastructure/ExportFileScanner.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace chatstamp::app {

namespace {

const std::string kRule(50, '=');

} // namespace

ChatStampApp::ChatStampApp(domain::RunConfig config, Collaborators collaborators)
    : m_config(std::move(config)), m_collaborators(std::move(collaborators)) {}

RunSummary ChatStampApp::Run() {
    // Patterns compile before any file is touched.
    auto extractor = infrastructure::DateExtractor::CreateDefault();

    RunSummary summary;
    std::cout << "chatstamp: export, rename and date-stamp conversations" << std::endl;
    std::cout << kRule << std::endl;

    if (m_config.dryRun) {
        std::cout << "[DRY RUN] No files will be created or modified" << std::endl;
    }
    if (m_config.verbose) {
        printConfiguration();
    }

    runExport(summary);

    std::cout << "\n" << kRule << std::endl;
    if (m_config.renameFiles) {
        renameFiles(summary);
    } else {
        std::cout << "Skipping file renaming (--no-rename specified)" << std::endl;
    }

    std::cout << "\n" << kRule << std::endl;
    if (!m_config.dryRun) {
        updateTimestamps(extractor, summary);
    } else {
        std::cout << "[DRY RUN] Would update file timestamps based on message dates" << std::endl;
    }

    printSummary(summary);
    return summary;
}

void ChatStampApp::printConfiguration() const {
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Output directory: " << m_config.outputDirectory << std::endl;
    std::cout << "  Format: " << domain::ToString(m_config.format) << std::endl;
    std::cout << "  Copy method: " << domain::ToString(m_config.copyMethod) << std::endl;
    std::cout << "  Database path: " << m_config.databasePath.value_or("default") << std::endl;
    std::cout << "  Attachment path: " << m_config.attachmentRoot.value_or("default") << std::endl;
    std::cout << "  Start date: " << m_config.startDate.value_or("none") << std::endl;
    std::cout << "  End date: " << m_config.endDate.value_or("none") << std::endl;
    std::cout << "  Contacts: " << m_config.contactsPath.value_or("none") << std::endl;
    std::cout << "  Exporter: " << m_config.exporter << std::endl;
    std::cout << "  Rename files: " << (m_config.renameFiles ? "true" : "false") << std::endl;
}

void ChatStampApp::runExport(RunSummary& summary) {
    if (m_config.dryRun) {
        std::cout << "[DRY RUN] Would run " << m_config.exporter << " with current settings" << std::endl;
        return;
    }

    std::cout << "Running iMessage export..." << std::endl;
    // SubprocessError propagates: nothing to post-process without an export.
    m_collaborators.exporter->run(m_config);
    summary.exportRan = true;
}

void ChatStampApp::renameFiles(RunSummary& summary) {
    std::cout << "Loading contacts and renaming files..." << std::endl;

    application::ContactIndexService contactService(m_collaborators.contacts, m_config.verbose);
    const domain::ContactIndex index = contactService.load();

    if (index.empty()) {
        std::cout << "No contacts found or contacts access denied. Files will keep original names." << std::endl;
        return;
    }

    std::vector<domain::ExportFile> files;
    try {
        files = infrastructure::ExportFileScanner(m_config.outputDirectory).scan();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[Renamer] " << e.what() << std::endl;
        ++summary.renameErrors;
        return;
    }

    application::RenameService renamer(index, m_config.dryRun, m_config.verbose);
    auto result = renamer.renameAll(files);
    summary.renamed = result.renamed;
    summary.unmatched = result.unmatched;
    summary.renameErrors = static_cast<int>(result.errors.size());
}

void ChatStampApp::updateTimestamps(const infrastructure::DateExtractor& extractor, RunSummary& summary) {
    std::cout << "Updating file timestamps based on message dates..." << std::endl;

    std::vector<domain::ExportFile> files;
    try {
        files = infrastructure::ExportFileScanner(m_config.outputDirectory).scan();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[Timestamps] " << e.what() << std::endl;
        ++summary.timestampErrors;
        return;
    }

    application::TimestampService service(extractor, m_collaborators.metadataWriter, m_config.verbose);
    auto result = service.updateAll(files);
    summary.timestampsUpdated = result.updated;
    summary.withoutDates = result.withoutDates;
    summary.timestampErrors = static_cast<int>(result.errors.size());
}

void ChatStampApp::printSummary(const RunSummary& summary) const {
    std::cout << "\n" << kRule << std::endl;
    if (m_config.renameFiles) {
        std::cout << (m_config.dryRun ? "Would rename " : "Renamed ") << summary.renamed << " files" << std::endl;
        if (summary.unmatched > 0) {
            std::cout << summary.unmatched << " files had no matching contacts" << std::endl;
        }
        if (summary.renameErrors > 0) {
            std::cout << summary.renameErrors << " files could not be renamed" << std::endl;
        }
    }

    if (m_config.dryRun) {
        std::cout << "Dry run completed. Use without --dry-run to actually export and rename files." << std::endl;
        return;
    }

    std::cout << "Updated timestamps for " << summary.timestampsUpdated << " files" << std::endl;
    if (summary.withoutDates > 0) {
        std::cout << summary.withoutDates << " files had no recognizable message dates" << std::endl;
    }
    if (summary.timestampErrors > 0) {
        std::cout << summary.timestampErrors << " files could not be updated" << std::endl;
    }
    std::cout << "Export and rename completed!" << std::endl;
    std::cout << "Files available at: " << m_config.outputDirectory << std::endl;
}

} // namespace chatstamp::app
