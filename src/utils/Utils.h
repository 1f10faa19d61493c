#ifndef UTILS_H
#define UTILS_H

#include <cstdint>

// Namespace for utility functions
namespace Utils {

    /**
     * @brief Calculate elapsed time between two millisecond timestamps
     *
     * millis() overflows after ~49.7 days (2^32 milliseconds).
     * Simple subtraction (now - start) handles overflow correctly due to
     * unsigned integer wraparound behavior in C/C++.
     *
     * Example: If start=0xFFFFFFF0 and now=0x00000010,
     *          now - start = 0x00000020 (32 ms elapsed) - correct!
     */
    inline uint32_t elapsedMs(uint32_t startTime, uint32_t now) {
        return now - startTime;
    }

    /**
     * @brief Check if an absolute deadline has been reached
     *
     * Valid as long as deadline and now are less than ~24.8 days apart.
     */
    inline bool deadlineReached(uint32_t deadline, uint32_t now) {
        return static_cast<int32_t>(now - deadline) >= 0;
    }

    inline uint32_t secondsToMs(uint32_t seconds) {
        return seconds * 1000UL;
    }

}

#endif // UTILS_H
