#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "domain/Errors.hpp"
#include "domain/RunConfig.hpp"
#include "infrastructure/ImessageExporterProcess.hpp"

using namespace chatstamp;
using infrastructure::ImessageExporterProcess;

namespace fs = std::filesystem;

namespace {

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& body) {
    const fs::path path = dir / name;
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

void TestQuoting() {
    ImessageExporterProcess process("/opt/my exporter");
    assert(process.buildCommand({"-o", "it's here"}) == "'/opt/my exporter' '-o' 'it'\\''s here' 2>&1");
    assert(ImessageExporterProcess("x").buildCommand({}) == "'x' 2>&1");
}

void TestSuccess(const fs::path& dir) {
    const fs::path argsFile = dir / "args.txt";
    const fs::path script = WriteScript(dir, "exporter-ok.sh",
                                        "echo \"$@\" > '" + argsFile.string() + "'\n"
                                        "echo exported 3 chats\n"
                                        "echo warning on stderr >&2\n");

    domain::RunConfig config;
    config.outputDirectory = (dir / "out dir").string();
    config.startDate = "2024-01-01";

    ImessageExporterProcess process(script.string());
    const std::string output = process.run(config);
    assert(output.find("exported 3 chats") != std::string::npos);
    assert(output.find("warning on stderr") != std::string::npos);

    std::ifstream in(argsFile);
    std::string line;
    std::getline(in, line);
    assert(line == "-f txt -c disabled -o " + config.outputDirectory + " -s 2024-01-01");
}

void TestFailures(const fs::path& dir) {
    domain::RunConfig config;
    config.outputDirectory = (dir / "out").string();

    const fs::path failing = WriteScript(dir, "exporter-fail.sh", "echo cannot read database\nexit 3\n");
    int exitCode = 0;
    try {
        ImessageExporterProcess(failing.string()).run(config);
    } catch (const domain::SubprocessError& e) {
        exitCode = e.exitCode();
    }
    assert(exitCode == 3);

    exitCode = 0;
    std::string message;
    try {
        ImessageExporterProcess((dir / "no-such-exporter").string()).run(config);
    } catch (const domain::SubprocessError& e) {
        exitCode = e.exitCode();
        message = e.what();
    }
    assert(exitCode == 127);
    assert(message.find("not found") != std::string::npos);
}

} // namespace

int main() {
    std::cout << "[Test] Starting ExporterProcess Test..." << std::endl;

    const fs::path dir = fs::temp_directory_path() / "chatstamp_exporter_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    TestQuoting();
    TestSuccess(dir);
    TestFailures(dir);

    fs::remove_all(dir);
    std::cout << "[PASS] ExporterProcess Test." << std::endl;
    return 0;
}
