// *****************************************************************************
// Main Program Entry Point
// *****************************************************************************

// Section 1: Includes
// C Standard Library
#include <csignal>
#include <cstdio>
#include <cstdlib>

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// System Includes
#include <poll.h>
#include <unistd.h>

// Project Includes
#include "change_indexer.h"
#include "diff_planner.h"
#include "human_readable.h"
#include "program_options.h"
#include "snapshot_manager.h"
#include "sync_config.h"
#include "sync_state_machine.h"
#include "transfer_command.h"
#include "util/event_bus.h"
#include "util/scheduler.h"
#include "util/sync_log.h"
#include "util/thread_pool.h"
#include "vfs/dataset_store.h"
#include "vfs/directory_vfs.h"

// Section 2: Defines and Macros
constexpr int STDIN_POLL_MS = 200;

// Section 3: Static Variables
static std::atomic<bool> gQuit(false);

// Section 4: Helpers
namespace
{
    /**
     * Everything one invocation works with, built in dependency order
     */
    struct App
    {
        explicit App(const ProgramOptions &options) :
            opts(options),
            store(options.storage)
        {}

        int init()
        {
            if (store.open() != 0) {
                std::cout << termcolor::red << "Cannot open storage root " << opts.storage << "\r\n" << termcolor::reset;
                return -1;
            }

            vfs = std::make_unique<DirectoryVfs>(store);
            configStore = std::make_unique<SyncConfigStore>(*vfs);
            const SyncError loaded = configStore->load();
            if (!loaded.ok()) {
                std::cout << termcolor::red << "Cannot load configuration: " << loaded.message << "\r\n" << termcolor::reset;
                return -1;
            }

            if (opts.jobs > 1)
                hashPool = std::make_unique<ThreadPool>(opts.jobs);

            engine = std::make_unique<SyncStateMachine>(*vfs, store, *configStore, log, events, scheduler,
                                                        SyncStateMachine::httpTransportFactory(), hashPool.get());
            snapshots = std::make_unique<SnapshotManager>(store, log);
            snapshots->setRestoreListener([this](const std::string &name) { engine->onDatasetRestored(name); });

            if (!opts.settings.empty()) {
                SyncConfiguration config = configStore->get();
                for (const auto &[key, value] : opts.settings)
                    if (ProgramOptions::applySetting(config, key, value) != 0)
                        return -1;
                const SyncError saved = engine->saveConfig(config);
                if (!saved.ok())
                    return -1;
            }
            return 0;
        }

        const ProgramOptions &opts;
        DatasetStore store;
        SyncLog log;
        EventBus events;
        ThreadScheduler scheduler;
        std::unique_ptr<ThreadPool> hashPool;
        std::unique_ptr<DirectoryVfs> vfs;
        std::unique_ptr<SyncConfigStore> configStore;
        std::unique_ptr<SyncStateMachine> engine;
        std::unique_ptr<SnapshotManager> snapshots;
    };

    std::string formatTime(int64_t millis)
    {
        const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tm{};
        localtime_r(&seconds, &tm);
        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    bool confirm(const ProgramOptions &opts, const std::string &question)
    {
        if (opts.assume_yes)
            return true;
        std::cout << termcolor::yellow << question << " [y/N] " << termcolor::reset << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer))
            return false;
        return answer == "y" || answer == "Y" || answer == "yes";
    }

    int report(const SyncError &err)
    {
        if (err.ok())
            return 0;
        std::cout << termcolor::red << syncErrorName(err.code) << ": " << err.message << "\r\n" << termcolor::reset;
        return err.code;
    }

    void printStatus(const SyncStatus &status)
    {
        std::cout << termcolor::white << "State:     " << toString(status.state) << "\r\n" << termcolor::reset;
        if (status.lastSyncTime)
            std::cout << termcolor::white << "Last sync: " << formatTime(*status.lastSyncTime) << "\r\n" << termcolor::reset;
        if (status.connection)
            std::cout << termcolor::white << "Transport: " << status.connection->type
                      << (status.connection->connected ? " (connected)" : " (not connected)") << "\r\n" << termcolor::reset;
        if (status.progress)
            std::cout << termcolor::white << "Progress:  " << toString(status.progress->phase) << " "
                      << status.progress->current << "/" << status.progress->total << "\r\n" << termcolor::reset;
        if (status.errorMessage)
            std::cout << termcolor::red << "Error:     " << *status.errorMessage << "\r\n" << termcolor::reset;
    }

    void printConflicts(const std::vector<SyncConflict> &conflicts)
    {
        if (conflicts.empty()) {
            std::cout << termcolor::green << "No outstanding conflicts" << "\r\n" << termcolor::reset;
            return;
        }
        for (const auto &conflict : conflicts) {
            std::cout << termcolor::yellow << conflict.id << "  " << conflict.path << "  (" << toString(conflict.type) << ")"
                      << "\r\n" << termcolor::reset;
            std::cout << termcolor::white << "\tlocal:  " << formatTime(conflict.localChange.timestamp) << "  "
                      << HumanReadable(conflict.localChange.size) << "  " << conflict.localChange.hash.substr(0, 12)
                      << "\r\n" << termcolor::reset;
            std::cout << termcolor::white << "\tremote: " << formatTime(conflict.remoteChange.timestamp) << "  "
                      << HumanReadable(conflict.remoteChange.size) << "  " << conflict.remoteChange.hash.substr(0, 12)
                      << "\r\n" << termcolor::reset;
        }
    }

    void printLogs(const std::vector<SyncLogEntry> &entries)
    {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it)
            std::cout << termcolor::white << formatTime(it->timestamp) << " [" << toString(it->level) << "] "
                      << it->message << "\r\n" << termcolor::reset;
    }

    /**
     * Plans a pass without touching anything and prints the transfers
     */
    int planOnly(App &app, SyncMode mode)
    {
        const SyncConfiguration config = app.configStore->get();
        SyncError err;
        std::shared_ptr<Transport> transport = SyncStateMachine::httpTransportFactory()(config, err);
        if (!transport)
            return report(err);
        transport->setPeerId(config.peer_id());

        if (config.token().empty() && !config.username().empty()) {
            std::string token;
            err = transport->login(config.username(), config.password(), token);
            if (!err.ok())
                return report(err);
            transport->setToken(token);
        }

        Manifest local;
        if (app.engine->indexer().index(config.filters(), local, app.opts.verbose) != 0)
            return report(SyncError::make(SYNC_ERR_IO, "could not index the workspace"));

        SyncPlan plan;
        if (mode == SyncMode::FORCE_PUSH) {
            plan = DiffPlanner::uploadAll(local);
        }
        else {
            const Manifest empty;
            const Manifest &sent = mode == SyncMode::FORCE_PULL ? empty : local;
            CheckResponse response;
            err = transport->check(sent, response);
            if (!err.ok())
                return report(err);
            plan = DiffPlanner::fromCheckResponse(sent, response, directionFor(SyncConfigStore::strategy(config), mode));
            DiffPlanner::restrictTo(plan, PathFilter(config.filters()));
        }

        TransferCommands commands = TransferCommands::fromPlan(plan);
        for (const auto &command : commands)
            command.print();
        for (const auto &divergence : plan.divergent)
            std::cout << termcolor::yellow << "divergent: " << divergence.path << "\r\n" << termcolor::reset;
        std::cout << termcolor::cyan << commands.size() << " transfers planned" << "\r\n" << termcolor::reset;

        if (app.opts.export_file && commands.exportToFile(*app.opts.export_file, app.opts.verbose) != 0)
            return report(SyncError::make(SYNC_ERR_IO, "could not write " + app.opts.export_file->string()));
        return 0;
    }

    int runSync(App &app, SyncMode mode, bool wait)
    {
        Subscription progress;
        if (app.opts.verbose && wait)
            progress = app.engine->on(SyncEventType::PROGRESS, [](const SyncEvent &event) {
                const SyncProgress &p = *event.progress;
                std::cout << termcolor::white << toString(p.phase) << " " << p.current << "/" << p.total;
                if (p.currentFile)
                    std::cout << " " << *p.currentFile;
                if (p.speed)
                    std::cout << " " << HumanReadable::rate(*p.speed);
                std::cout << "\r\n" << termcolor::reset;
            });

        const SyncError err = app.engine->triggerSync(mode);
        if (!err.ok())
            return report(err);
        if (!wait)
            return 0;

        app.engine->waitForIdle();
        progress.unsubscribe();
        const SyncStatus status = app.engine->getStatus();
        if (app.opts.index_file && app.engine->indexer().dumpIndexToFile(*app.opts.index_file) != 0)
            std::cout << termcolor::yellow << "Could not write " << *app.opts.index_file << "\r\n" << termcolor::reset;
        return status.state == SyncState::SUCCESS ? 0 : SYNC_ERR_NETWORK;
    }

    int runSnapshot(App &app, const std::vector<std::string> &args)
    {
        const std::string sub = args.size() > 1 ? args[1] : "list";
        if (sub == "create") {
            Snapshot snapshot;
            const SyncError err = app.snapshots->createSnapshot(&snapshot);
            if (err.ok())
                std::cout << termcolor::green << "Created " << snapshot.name << " ("
                          << HumanReadable(snapshot.sizeEstimate) << ")" << "\r\n" << termcolor::reset;
            return report(err);
        }
        if (sub == "list") {
            for (const auto &snapshot : app.snapshots->listSnapshots())
                std::cout << termcolor::white << snapshot.name << "  " << formatTime(snapshot.createdAt) << "  "
                          << HumanReadable(snapshot.sizeEstimate) << "\r\n" << termcolor::reset;
            return 0;
        }
        if (args.size() < 3) {
            printusage();
            return SYNC_ERR_INVALID_ARGUMENT;
        }
        if (sub == "restore") {
            if (!confirm(app.opts, "Replace the workspace with " + args[2] + "?"))
                return 0;
            return report(app.snapshots->restoreSnapshot(args[2]));
        }
        if (sub == "delete")
            return report(app.snapshots->deleteSnapshot(args[2]));
        if (sub == "export") {
            const std::string target = args.size() > 3 ? args[3] : args[2] + ".json";
            const SyncError err = app.snapshots->exportSnapshot(args[2], target);
            if (err.ok())
                std::cout << termcolor::green << "Exported " << args[2] << " to " << target << "\r\n" << termcolor::reset;
            return report(err);
        }

        printusage();
        return SYNC_ERR_INVALID_ARGUMENT;
    }

    int runConfig(App &app, const std::vector<std::string> &args)
    {
        if (args.size() < 2 || args[1] == "show") {
            std::string json;
            const SyncError err = SyncConfigStore::toJson(app.engine->getConfig(), json);
            if (err.ok())
                std::cout << json << "\r\n";
            return report(err);
        }
        if (args[1] != "set" || args.size() < 3) {
            printusage();
            return SYNC_ERR_INVALID_ARGUMENT;
        }

        SyncConfiguration config = app.engine->getConfig();
        for (size_t i = 2; i < args.size(); ++i) {
            const auto [key, value] = ProgramOptions::parseConfigLine(args[i]);
            if (key.empty() || ProgramOptions::applySetting(config, key, value) != 0)
                return SYNC_ERR_INVALID_ARGUMENT;
        }
        return report(app.engine->saveConfig(config));
    }

    int runResolve(App &app, const std::vector<std::string> &args)
    {
        if (args.size() < 3) {
            printusage();
            return SYNC_ERR_INVALID_ARGUMENT;
        }
        const auto resolution = parseResolution(args[2]);
        if (!resolution) {
            std::cout << termcolor::red << "Resolution must be local or remote" << "\r\n" << termcolor::reset;
            return SYNC_ERR_INVALID_ARGUMENT;
        }

        if (args[1] == "all") {
            const size_t failures = app.engine->resolveAllConflicts(*resolution).get();
            return failures == 0 ? 0 : SYNC_ERR_NETWORK;
        }
        return report(app.engine->resolveConflict(args[1], *resolution).get());
    }

    /**
     * Runs one command
     * @param daemon Commands come from the console, sync does not wait
     */
    int dispatch(App &app, const std::vector<std::string> &args, bool daemon)
    {
        const std::string &cmd = args.front();

        if (cmd == "sync") {
            const auto mode = parseSyncMode(args.size() > 1 ? args[1] : "standard");
            if (!mode) {
                std::cout << termcolor::red << "Unknown sync mode " << args[1] << "\r\n" << termcolor::reset;
                return SYNC_ERR_INVALID_ARGUMENT;
            }
            if (app.opts.dry_run)
                return planOnly(app, *mode);
            return runSync(app, *mode, !daemon);
        }
        if (cmd == "status") {
            printStatus(app.engine->getStatus());
            return 0;
        }
        if (cmd == "test") {
            const SyncConfiguration config = app.engine->getConfig();
            return report(app.engine->testConnection(args.size() > 1 ? args[1] : config.endpoint(), config.username(),
                                                     config.token()));
        }
        if (cmd == "config")
            return runConfig(app, args);
        if (cmd == "conflicts") {
            // conflicts live in memory, a one-shot run needs a pass to learn them
            if (!daemon && app.engine->getConflicts().empty() && runSync(app, SyncMode::STANDARD, true) != 0)
                std::cout << termcolor::yellow << "Sync pass failed, the list may be incomplete" << "\r\n" << termcolor::reset;
            printConflicts(app.engine->getConflicts());
            return 0;
        }
        if (cmd == "resolve") {
            if (!daemon && app.engine->getConflicts().empty() && runSync(app, SyncMode::STANDARD, true) != 0)
                std::cout << termcolor::yellow << "Sync pass failed, the conflict may be unknown" << "\r\n" << termcolor::reset;
            return runResolve(app, args);
        }
        if (cmd == "snapshot")
            return runSnapshot(app, args);
        if (cmd == "logs") {
            size_t limit = SYNC_LOG_DEFAULT_LIMIT;
            if (args.size() > 1)
                limit = std::strtoul(args[1].c_str(), nullptr, 10);
            printLogs(app.engine->getLogs(limit));
            return 0;
        }
        if (cmd == "clear-logs") {
            app.engine->clearLogs();
            return 0;
        }
        if (cmd == "pause")
            return report(app.engine->pause());
        if (cmd == "resume")
            return report(app.engine->resume());
        if (cmd == "reconnect")
            return report(app.engine->reconnect());

        std::cout << termcolor::red << "Unknown command " << cmd << "\r\n" << termcolor::reset;
        if (!daemon)
            printusage();
        return SYNC_ERR_INVALID_ARGUMENT;
    }

    std::vector<std::string> splitWords(const std::string &line)
    {
        std::vector<std::string> words;
        std::istringstream stream(line);
        std::string word;
        while (stream >> word)
            words.push_back(word);
        return words;
    }

    void onSignal(int)
    {
        gQuit = true;
    }

    int runDaemon(App &app)
    {
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        auto stateSub = app.engine->on(SyncEventType::STATE_CHANGE, [](const SyncEvent &event) {
            if (event.state)
                std::cout << termcolor::magenta << "state: " << toString(*event.state) << "\r\n" << termcolor::reset;
        });
        auto conflictSub = app.engine->on(SyncEventType::CONFLICT, [](const SyncEvent &event) {
            if (event.conflict)
                std::cout << termcolor::yellow << "conflict " << event.conflict->id << " on " << event.conflict->path
                          << "\r\n" << termcolor::reset;
        });

        app.engine->start();
        std::cout << termcolor::green << "Daemon running on " << app.opts.storage << ", type help for commands" << "\r\n" << termcolor::reset;

        std::string line;
        while (!gQuit)
        {
            struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
            const int ready = poll(&pfd, 1, STDIN_POLL_MS);
            if (ready <= 0)
                continue;
            if (!std::getline(std::cin, line))
                break;

            const auto words = splitWords(line);
            if (words.empty())
                continue;
            if (words.front() == "quit" || words.front() == "exit")
                break;
            if (words.front() == "help" || words.front() == "daemon") {
                printusage();
                continue;
            }
            dispatch(app, words, true);
        }

        stateSub.unsubscribe();
        conflictSub.unsubscribe();
        app.engine->dispose();
        std::cout << termcolor::green << "Daemon stopped" << "\r\n" << termcolor::reset;
        return 0;
    }
}

// Section 5: Main Function
int main(int argc, char *argv[])
{
    const auto opts = ProgramOptions::parseArgs(argc, argv);

    App app(opts);
    if (app.init() != 0)
        return EXIT_FAILURE;

    int ret = 0;
    if (opts.command.front() == "daemon")
        ret = runDaemon(app);
    else
        ret = dispatch(app, opts.command, false);

    app.engine->dispose();
    return ret == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
