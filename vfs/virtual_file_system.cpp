// Section 1: Main Header
#include "virtual_file_system.h"

// Section 2: Includes
#include <algorithm>
#include <sstream>

// Section 3: Public Methods
bool VirtualFileSystem::isSystemModule(std::string_view module)
{
    return std::find(SYSTEM_MODULES.begin(), SYSTEM_MODULES.end(), module) != SYSTEM_MODULES.end();
}

bool VirtualFileSystem::splitPath(const std::string &path, std::string &module, std::string &relativePath)
{
    std::vector<std::string> parts;
    std::stringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (part.empty() || part == ".")
            continue;
        if (part == "..")
            return false;
        parts.push_back(part);
    }

    if (parts.size() < 2)
        return false;

    module = parts.front();
    relativePath.clear();
    for (size_t i = 1; i < parts.size(); ++i) {
        if (i > 1)
            relativePath += '/';
        relativePath += parts[i];
    }
    return true;
}

std::string VirtualFileSystem::joinPath(const std::string &module, const std::string &relativePath)
{
    std::string path = "/" + module;
    if (!relativePath.empty() && relativePath.front() != '/')
        path += '/';
    return path + relativePath;
}
