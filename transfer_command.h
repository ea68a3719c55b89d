// Section 1: Compilation Guards
#ifndef _TRANSFER_COMMAND_H_
#define _TRANSFER_COMMAND_H_

// Section 2: Includes
#include <filesystem>
#include <list>
#include <string>

#include "diff_planner.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Classes
/**
 * One file transfer of a sync pass
 */
class TransferCommand {
public:
    enum KIND : std::uint8_t {
        KIND_UPLOAD = 0,    ///< send the local file to the remote peer
        KIND_DOWNLOAD,      ///< fetch the remote file and write it locally
        KIND_REMOVE,        ///< remote tombstone, delete the local file
    };

    TransferCommand(KIND kind, ManifestEntry entry);

    bool operator==(const TransferCommand &other) const {
        return mKind == other.mKind && mEntry.path() == other.mEntry.path() && mEntry.hash() == other.mEntry.hash();
    }
    bool operator!=(const TransferCommand &other) const {
        return !(*this == other);
    }

    /**
     * Prints the command to standard output
     */
    void print() const;

    [[nodiscard]] std::string string() const;

    [[nodiscard]] KIND kind() const { return mKind; }
    [[nodiscard]] bool isUpload() const { return mKind == KIND_UPLOAD; }
    [[nodiscard]] bool isRemoval() const { return mKind == KIND_REMOVE; }
    [[nodiscard]] const ManifestEntry &entry() const { return mEntry; }
    [[nodiscard]] const std::string &path() const { return mEntry.path(); }

private:
    KIND mKind;
    ManifestEntry mEntry;
};

class TransferCommands : public std::list<TransferCommand> {
public:
    /**
     * Uploads for plan.uploads, downloads or removals for plan.downloads
     */
    static TransferCommands fromPlan(const SyncPlan &plan);

    int exportToFile(const std::filesystem::path &path, bool verbose = false) const;

    /**
     * Uploads first, then downloads, removals last
     */
    void sortCommands();

    [[nodiscard]] size_t countOf(TransferCommand::KIND kind) const;
};

#endif // _TRANSFER_COMMAND_H_
