// Section 1: Main Header
#include "transfer_command.h"

// Section 2: Includes
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Project Includes
#include "human_readable.h"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
// (none)

// Section 5: Constructors and Destructors
TransferCommand::TransferCommand(KIND kind, ManifestEntry entry) : mKind(kind), mEntry(std::move(entry)) {}

// Section 6: Static Methods
TransferCommands TransferCommands::fromPlan(const SyncPlan &plan)
{
    TransferCommands commands;
    for (const auto &entry : plan.uploads)
        commands.emplace_back(TransferCommand::KIND_UPLOAD, entry);
    for (const auto &entry : plan.downloads)
        commands.emplace_back(entry.is_deleted() ? TransferCommand::KIND_REMOVE : TransferCommand::KIND_DOWNLOAD, entry);
    commands.sortCommands();
    return commands;
}

// Section 7: Public/Protected/Private Methods
void TransferCommand::print() const
{
    std::cout << termcolor::blue << string() << "\r\n" << termcolor::reset;
}

std::string TransferCommand::string() const
{
    std::ostringstream out;
    switch (mKind) {
        case KIND_UPLOAD: out << "upload "; break;
        case KIND_DOWNLOAD: out << "download "; break;
        case KIND_REMOVE: out << "remove "; break;
    }
    out << "\"" << mEntry.path() << "\"";
    if (mKind != KIND_REMOVE)
        out << " (" << HumanReadable(mEntry.size()) << ")";
    return out.str();
}

int TransferCommands::exportToFile(const std::filesystem::path &path, bool verbose) const
{
    std::ofstream file(path);
    if (!file.is_open())
        return -1;
    for (const auto &cmd : *this) {
        file << cmd.string() << "\r\n";
        if (verbose)
            std::cout << termcolor::blue << "Exported: " << cmd.string() << "\r\n" << termcolor::reset;
    }
    file.close();
    return file.fail() ? -1 : 0;
}

void TransferCommands::sortCommands()
{
    // list::sort is stable, the path order from the plan survives within a kind
    this->sort([](const TransferCommand &commandA, const TransferCommand &commandB) {
        return commandA.kind() < commandB.kind();
    });
}

size_t TransferCommands::countOf(TransferCommand::KIND kind) const
{
    return static_cast<size_t>(std::count_if(begin(), end(), [kind](const TransferCommand &cmd) { return cmd.kind() == kind; }));
}
