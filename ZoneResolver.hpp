// File: ZoneResolver.hpp
// Description: Maps a dial tap to one of the five hit zones.
#pragma once

#include "CombatTypes.hpp"

static const double DEFAULT_ACCURACY_SCALE_MAX = 0.4;

/**
 * @brief Rescales band widths by accuracy. Injure and miss shrink by
 * 1 + scaleMax * accuracy; the freed degrees go to normal and crit in
 * proportion to their widths (all to normal when both are zero). Graze is
 * untouched and the total never changes, so no band goes negative and the
 * sum stays <= 360.
 * @throws ValidationError if accuracy is outside [0,1] or the bands are invalid.
 */
WeaponBandConfig adjustBandsForAccuracy(const WeaponBandConfig& bands, double accuracy,
	double scaleMax = DEFAULT_ACCURACY_SCALE_MAX);

/**
 * @brief Finds the band whose arc contains the tap. Bands are laid out from
 * 0 degrees as injure, miss, graze, normal, crit. When the bands sum to less
 * than 360 the unallocated arc closes the circle back onto injure.
 * @throws ValidationError if tapDegrees is outside [0,360).
 */
HitZone zoneForDegree(double tapDegrees, const WeaponBandConfig& adjustedBands);

// adjustBandsForAccuracy followed by zoneForDegree.
HitZone resolveZone(double tapDegrees, const WeaponBandConfig& bands, double accuracy,
	double scaleMax = DEFAULT_ACCURACY_SCALE_MAX);

void validateBands(const WeaponBandConfig& bands);
void validateAccuracy(double accuracy, const char* label);
