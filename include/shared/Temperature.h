#ifndef TEMPERATURE_H
#define TEMPERATURE_H

#include <cstdint>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstddef>
#include "config/TemperatureConstants.h"

// Fixed-point temperature type (tenths of degrees Celsius)
// Range: -3276.8°C to +3276.7°C with 0.1°C precision
typedef int16_t Temperature_t;

// Special values
constexpr Temperature_t TEMP_INVALID = INT16_MIN;      // -32768
constexpr Temperature_t TEMP_UNKNOWN = INT16_MIN + 1;  // -32767
constexpr Temperature_t TEMP_MIN_VALID = INT16_MIN + 2;  // -3276.6°C

// Conversion functions
inline Temperature_t tempFromFloat(float f) {
    if (std::isnan(f) || std::isinf(f)) return TEMP_INVALID;
    if (f > TemperatureConstants::TEMP_MAX_FLOAT) return 32767;   // Clamp to max
    if (f < TemperatureConstants::TEMP_MIN_FLOAT) return TEMP_MIN_VALID;  // Clamp above the markers
    return static_cast<Temperature_t>(
        f * TemperatureConstants::TEMP_SCALE_FACTOR +
        (f >= 0 ? TemperatureConstants::TEMP_ROUNDING_POSITIVE
                : TemperatureConstants::TEMP_ROUNDING_NEGATIVE)
    );
}

inline float tempToFloat(Temperature_t t) {
    if (t == TEMP_INVALID || t == TEMP_UNKNOWN) return NAN;
    return t / TemperatureConstants::TEMP_SCALE_FACTOR;
}

// Utility to create temperature from whole degrees
inline Temperature_t tempFromWhole(int degrees) {
    return static_cast<Temperature_t>(degrees * 10);
}

inline bool tempIsValid(Temperature_t t) {
    return t != TEMP_INVALID && t != TEMP_UNKNOWN;
}

// Formatting helper - returns number of characters written
inline int formatTemp(char* buf, size_t size, Temperature_t t) {
    if (!tempIsValid(t)) {
        return snprintf(buf, size, "N/A");
    }
    int whole = t / 10;
    int frac = abs(t % 10);
    // Handle the special case where -1 < temp < 0
    if (t < 0 && whole == 0) {
        return snprintf(buf, size, "-0.%d", frac);
    }
    return snprintf(buf, size, "%d.%d", whole, frac);
}

// Temperature math helpers (saturating, invalid propagates)
inline Temperature_t tempAdd(Temperature_t a, Temperature_t b) {
    if (!tempIsValid(a) || !tempIsValid(b)) return TEMP_INVALID;
    int32_t result = static_cast<int32_t>(a) + static_cast<int32_t>(b);
    if (result > 32767) return 32767;
    if (result < TEMP_MIN_VALID) return TEMP_MIN_VALID;
    return static_cast<Temperature_t>(result);
}

inline Temperature_t tempSub(Temperature_t a, Temperature_t b) {
    if (!tempIsValid(a) || !tempIsValid(b)) return TEMP_INVALID;
    int32_t result = static_cast<int32_t>(a) - static_cast<int32_t>(b);
    if (result > 32767) return 32767;
    if (result < TEMP_MIN_VALID) return TEMP_MIN_VALID;
    return static_cast<Temperature_t>(result);
}

/**
 * @brief Sum of the valid entries in tenths
 *
 * Band and ceiling checks compare this against count * threshold, so the
 * exact mean decides. tempAverage() is rounded and only fit for display.
 * @param validCount Optional output: number of entries that contributed
 */
inline int32_t tempSum(const Temperature_t* values, size_t count,
                       uint8_t* validCount = nullptr) {
    int32_t sum = 0;
    uint8_t n = 0;
    for (size_t i = 0; i < count; i++) {
        if (tempIsValid(values[i])) {
            sum += values[i];
            n++;
        }
    }
    if (validCount) {
        *validCount = n;
    }
    return sum;
}

/**
 * @brief Arithmetic mean of the valid entries, rounded half away from zero
 * @param values Array of readings, invalid entries are skipped
 * @param count Number of entries in values
 * @param validCount Optional output: number of entries that contributed
 * @return Mean, or TEMP_INVALID when no entry is valid
 */
inline Temperature_t tempAverage(const Temperature_t* values, size_t count,
                                 uint8_t* validCount = nullptr) {
    uint8_t valid = 0;
    const int32_t sum = tempSum(values, count, &valid);
    const int32_t n = valid;
    if (validCount) {
        *validCount = valid;
    }
    if (n == 0) {
        return TEMP_INVALID;
    }
    int32_t half = n / 2;
    int32_t mean = (sum >= 0) ? (sum + half) / n : (sum - half) / n;
    return static_cast<Temperature_t>(mean);
}

// Logging helper macro
#define LOG_TEMP(buf, temp) formatTemp(buf, sizeof(buf), temp)

#endif // TEMPERATURE_H
