#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/ChatStampApp.hpp"
#include "app/CommandLine.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContactStoreFactory.hpp"
#include "infrastructure/FileTimestampWriter.hpp"
#include "infrastructure/ImessageExporterProcess.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace chatstamp;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "chatstamp";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    try {
        auto options = app::CommandLine::Parse(args);
        if (options.helpRequested) {
            std::cout << app::CommandLine::Usage(program);
            return 0;
        }

        domain::RunConfig config;
        if (options.configPath) {
            if (!infrastructure::ConfigLoader::ApplySettingsFile(*options.configPath, config)) {
                throw domain::ConfigurationError("Settings file not found: " + *options.configPath);
            }
        } else {
            infrastructure::ConfigLoader::ApplySettingsFile(infrastructure::PathUtils::GetDefaultSettingsPath(), config);
        }
        options.applyTo(config);

        app::ChatStampApp::Collaborators collaborators;
        collaborators.exporter = std::make_shared<infrastructure::ImessageExporterProcess>(config.exporter);
        collaborators.contacts = infrastructure::ContactStoreFactory::Create(config.contactsPath);
        collaborators.metadataWriter = std::make_shared<infrastructure::FileTimestampWriter>();

        app::ChatStampApp application(config, collaborators);
        application.Run();
        return 0;
    } catch (const domain::ArgumentError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
    } catch (const domain::SubprocessError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Export failed. Exiting." << std::endl;
    }
    return 1;
}
