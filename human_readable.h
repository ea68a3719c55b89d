// *****************************************************************************
// Human Readable Utility
// *****************************************************************************

#ifndef _HUMAN_READABLE_H_
#define _HUMAN_READABLE_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>

constexpr size_t ONE_KILOBYTE = 1 << 10; // 1024 bytes

// Section 2: Class Definition
// Formats a byte count (or a byte rate) for log lines, e.g. "1.50 MB" or "320.00 KB/s"
class HumanReadable {
public:
    double size;
    bool perSecond;

    explicit HumanReadable(uintmax_t bytes) : size(static_cast<double>(bytes)), perSecond(false) {}

    static HumanReadable rate(double bytesPerSecond)
    {
        HumanReadable value(0);
        value.size = bytesPerSecond;
        value.perSecond = true;
        return value;
    }

    friend std::ostream& operator<<(std::ostream& outputStream, const HumanReadable& humanReadable) {
        const char* units[] = {"B", "KB", "MB", "GB", "TB"};
        size_t unitIndex = 0;
        double size = humanReadable.size;

        while (size >= ONE_KILOBYTE && unitIndex < 4) {
            size /= ONE_KILOBYTE;
            unitIndex++;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(unitIndex == 0 ? 0 : 2) << size << " " << units[unitIndex];
        if (humanReadable.perSecond)
            oss << "/s";
        return outputStream << oss.str();
    }
};

#endif // _HUMAN_READABLE_H_
