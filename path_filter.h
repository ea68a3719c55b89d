// Section 1: Compilation Guards
#ifndef _PATH_FILTER_H_
#define _PATH_FILTER_H_

// Section 2: Includes
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sync_config.h"

// Section 3: Defines and Macros
constexpr size_t BINARY_SNIFF_LENGTH = 8 * 1024;

// Section 4: Classes
/**
 * Decides which workspace files take part in a sync, from the filters block
 * of the configuration.
 *
 * Patterns are globs over module-qualified paths: '*' stays within one path
 * segment, '**' spans any number of segments, '?' is one character. A pattern
 * without a leading '/' may match at any depth ("*.tmp" rejects every .tmp
 * file). A trailing '/' matches everything below that directory.
 */
class PathFilter {
public:
    explicit PathFilter(const SyncConfiguration::Filters &filters);

    /**
     * Checks the path against include and exclude patterns and the size limit
     * @param path /module/relative/path
     * @param size File size in bytes
     */
    [[nodiscard]] bool accepts(const std::string &path, uint64_t size) const;

    /**
     * Content check, only meaningful when binary files are excluded
     */
    [[nodiscard]] bool acceptsContent(std::string_view content) const;

    [[nodiscard]] bool excludesBinary() const { return mExcludeBinary; }

    static bool matches(const std::string &pattern, const std::string &path);

    /**
     * NUL byte within the first BINARY_SNIFF_LENGTH bytes
     */
    static bool looksBinary(std::string_view content);

private:
    static bool globMatch(std::string_view pattern, std::string_view text);

    std::vector<std::string> mInclude;
    std::vector<std::string> mExclude;
    uint64_t mMaxFileSize;
    bool mExcludeBinary;
};

#endif // _PATH_FILTER_H_
