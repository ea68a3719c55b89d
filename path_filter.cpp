// Section 1: Main Header
#include "path_filter.h"

// Section 2: Includes
#include <algorithm>

// Section 3: Constructors and Destructors
PathFilter::PathFilter(const SyncConfiguration::Filters &filters) :
    mInclude(filters.include_paths().begin(), filters.include_paths().end()),
    mExclude(filters.exclude_paths().begin(), filters.exclude_paths().end()),
    mMaxFileSize(filters.has_max_file_size() ? filters.max_file_size() : DEFAULT_MAX_FILE_SIZE),
    mExcludeBinary(filters.exclude_binary())
{}

// Section 4: Public Methods
bool PathFilter::accepts(const std::string &path, uint64_t size) const
{
    if (mMaxFileSize > 0 && size > mMaxFileSize)
        return false;

    if (!mInclude.empty() &&
        std::none_of(mInclude.begin(), mInclude.end(), [&](const std::string &pattern) { return matches(pattern, path); }))
        return false;

    return std::none_of(mExclude.begin(), mExclude.end(), [&](const std::string &pattern) { return matches(pattern, path); });
}

bool PathFilter::acceptsContent(std::string_view content) const
{
    return !mExcludeBinary || !looksBinary(content);
}

bool PathFilter::matches(const std::string &pattern, const std::string &path)
{
    if (pattern.empty())
        return false;

    std::string effective = pattern;
    if (effective.back() == '/')
        effective += "**";

    if (effective.front() == '/')
        return globMatch(effective, path);

    // unanchored: try every suffix starting at a segment boundary
    for (size_t pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1))
        if (globMatch(effective, std::string_view(path).substr(pos + 1)))
            return true;
    return false;
}

bool PathFilter::looksBinary(std::string_view content)
{
    return content.substr(0, BINARY_SNIFF_LENGTH).find('\0') != std::string_view::npos;
}

// Section 5: Private Methods
bool PathFilter::globMatch(std::string_view pattern, std::string_view text)
{
    size_t pi = 0;
    size_t ti = 0;
    while (pi < pattern.size())
    {
        if (pattern.substr(pi, 2) == "**") {
            size_t next = pi + 2;
            // "a/**/b" also matches "a/b"
            if (next < pattern.size() && pattern[next] == '/' && globMatch(pattern.substr(next + 1), text.substr(ti)))
                return true;
            for (size_t k = ti; k <= text.size(); ++k)
                if (globMatch(pattern.substr(next), text.substr(k)))
                    return true;
            return false;
        }

        if (pattern[pi] == '*') {
            for (size_t k = ti; ; ++k) {
                if (globMatch(pattern.substr(pi + 1), text.substr(k)))
                    return true;
                if (k == text.size() || text[k] == '/')
                    return false;
            }
        }

        if (ti == text.size())
            return false;
        if (pattern[pi] == '?') {
            if (text[ti] == '/')
                return false;
        } else if (pattern[pi] != text[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }
    return ti == text.size();
}
