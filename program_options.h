// Section 1: Compilation Guards
#ifndef _PROGRAM_OPTIONS_H_
#define _PROGRAM_OPTIONS_H_

// Section 2: Includes
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sync_config.h"

// Section 3: Defines and Macros
constexpr const char *DEFAULT_STORAGE_DIR = ".workspace-sync";

class ProgramOptions {
public:
    // Command line options
    std::filesystem::path storage;      // Root holding the live dataset and its snapshots
    unsigned jobs = 1;                  // Hashing threads, 1 hashes sequentially
    bool assume_yes = false;            // Skip Y/N prompts
    bool dry_run = false;               // Plan only, print the transfers
    bool verbose = false;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> export_file;   // Transfer list written by --dry-run
    std::optional<std::filesystem::path> index_file;    // Manifest dump
    std::vector<std::string> command;

    // Config file options, KEY=VALUE pairs applied over the stored configuration
    std::vector<std::pair<std::string, std::string>> settings;

    static ProgramOptions parseArgs(int argc, char *argv[]);
    int parseConfigFile();

    /**
     * Applies one KEY=VALUE setting, keys as written in the --cfg file
     * @return 0 on success, negative for an unknown key or a malformed value
     */
    static int applySetting(SyncConfiguration &config, const std::string &key, const std::string &value);

    static std::pair<std::string, std::string> parseConfigLine(const std::string &line);

private:
    ProgramOptions() = default;

    static std::optional<uint64_t> parseSize(const std::string &value);
    static std::optional<bool> parseBool(const std::string &value);
};

void printusage();

#endif  // _PROGRAM_OPTIONS_H_
