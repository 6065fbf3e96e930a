#ifndef HOMEIO_PIN_LIMITS_H
#define HOMEIO_PIN_LIMITS_H

#include <stdint.h>

// Addressable GPIO lines on the 40-pin header
#define PIN_ID_MIN            0
#define PIN_ID_MAX            40

// Digital levels
#define PIN_LEVEL_LOW         0
#define PIN_LEVEL_HIGH        1

// Dimming is on/off only: brightness above the threshold drives HIGH
#define BRIGHTNESS_MIN        0
#define BRIGHTNESS_MAX        100
#define BRIGHTNESS_ON_ABOVE   50

// Timed pump runs
#define PUMP_DURATION_MIN_S   1

// sysfs export settle time
#define SYSFS_EXPORT_SETTLE_US 50000

static inline int pin_id_valid(int pin) {
    return pin >= PIN_ID_MIN && pin <= PIN_ID_MAX;
}

static inline int pin_level_valid(int value) {
    return value == PIN_LEVEL_LOW || value == PIN_LEVEL_HIGH;
}

static inline int brightness_to_level(double brightness) {
    return brightness > BRIGHTNESS_ON_ABOVE ? PIN_LEVEL_HIGH : PIN_LEVEL_LOW;
}

#endif // HOMEIO_PIN_LIMITS_H
