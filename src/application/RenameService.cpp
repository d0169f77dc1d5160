/**
 * @file RenameService.cpp
 * @brief Implementation of RenameService.
 */

#include "application/RenameService.hpp"
#include "domain/FilenameTokenizer.hpp"
#include "domain/NameResolver.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace chatstamp::application {

namespace {

bool IsForbidden(char c) {
    static const std::string kForbiddenChars = "<>:\"/\\|?*";
    return kForbiddenChars.find(c) != std::string::npos;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    return joined;
}

} // namespace

RenameService::RenameService(const domain::ContactIndex& index, bool dryRun, bool verbose)
    : m_index(index), m_dryRun(dryRun), m_verbose(verbose) {}

std::string RenameService::sanitizeFilename(const std::string& name) {
    std::string collapsed;
    collapsed.reserve(name.size());
    for (char c : name) {
        char out = IsForbidden(c) ? '_' : c;
        if (out == '_' && !collapsed.empty() && collapsed.back() == '_') continue;
        collapsed.push_back(out);
    }

    const auto first = collapsed.find_first_not_of('_');
    if (first == std::string::npos) return "";
    const auto last = collapsed.find_last_not_of('_');
    return collapsed.substr(first, last - first + 1);
}

bool RenameService::isRenameCandidate(const std::string& filename) {
    return std::any_of(filename.begin(), filename.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '@';
    });
}

bool RenameService::isTaken(const fs::path& path) const {
    if (m_claimed.count(path)) return true;
    if (m_vacated.count(path)) return false;
    std::error_code ec;
    return fs::exists(path, ec);
}

fs::path RenameService::resolveCollision(const fs::path& current, const std::string& baseName) const {
    const fs::path dir = current.parent_path();
    const std::string ext = current.extension().string();

    fs::path candidate = dir / (baseName + ext);
    int counter = 1;
    while (candidate != current && isTaken(candidate)) {
        candidate = dir / (baseName + " (" + std::to_string(counter) + ")" + ext);
        ++counter;
    }
    return candidate;
}

RenameService::RenameResult RenameService::renameAll(const std::vector<domain::ExportFile>& files) {
    RenameResult result;
    m_claimed.clear();
    m_vacated.clear();

    std::vector<domain::ExportFile> candidates;
    std::copy_if(files.begin(), files.end(), std::back_inserter(candidates),
                 [](const domain::ExportFile& f) { return isRenameCandidate(f.filename); });
    result.candidates = static_cast<int>(candidates.size());

    if (m_verbose) {
        std::cout << "[Renamer] Found " << result.candidates << " files to potentially rename" << std::endl;
    }

    for (const auto& file : candidates) {
        processFile(file, result);
    }
    return result;
}

void RenameService::processFile(const domain::ExportFile& file, RenameResult& result) {
    auto identifiers = domain::FilenameTokenizer::tokenize(file.filename);

    if (m_verbose) {
        std::cout << "[Renamer] Processing file: " << file.filename << std::endl;
        std::cout << "  Extracted identifiers:";
        for (const auto& id : identifiers) std::cout << " " << id.value;
        std::cout << std::endl;
    }

    domain::NameResolver::MatchObserver observer;
    if (m_verbose) {
        observer = [](const domain::Identifier& id, const std::optional<std::string>& name) {
            if (name) {
                std::cout << "  Matched: " << id.value << " -> " << *name << std::endl;
            } else {
                std::cout << "  No match for: " << id.value << std::endl;
            }
        };
    }
    auto matchedNames = domain::NameResolver::resolve(identifiers, m_index, observer);

    const std::string sanitized = sanitizeFilename(JoinNames(matchedNames));
    if (sanitized.empty()) {
        ++result.unmatched;
        if (m_verbose) {
            std::cout << "[Renamer] No matching contacts found for: " << file.filename << std::endl;
        }
        return;
    }

    const fs::path current(file.path);
    const fs::path target = resolveCollision(current, sanitized);
    if (target == current) {
        ++result.unchanged;
        return;
    }

    const std::string targetName = target.filename().string();
    if (m_verbose || m_dryRun) {
        std::cout << (m_dryRun ? "[DRY RUN] " : "") << "Renaming:" << std::endl;
        std::cout << "  From: " << file.filename << std::endl;
        std::cout << "  To:   " << targetName << std::endl;
    }

    if (!m_dryRun) {
        try {
            fs::rename(current, target);
        } catch (const fs::filesystem_error& e) {
            std::cerr << "[Renamer] Error renaming " << file.filename << ": " << e.what() << std::endl;
            result.errors.push_back(file.filename + ": " + e.what());
            return;
        }
        if (m_verbose) {
            std::cout << "  Successfully renamed" << std::endl;
        }
    }

    m_claimed.insert(target);
    m_claimed.erase(current);
    m_vacated.insert(current);
    m_vacated.erase(target);

    ++result.renamed;
    result.renames.push_back({file.filename, targetName});
}

} // namespace chatstamp::application
