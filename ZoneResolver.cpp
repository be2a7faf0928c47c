// File: ZoneResolver.cpp
// Description: Accuracy-adjusted dial bands and tap-to-zone mapping.
#include "ZoneResolver.hpp"
#include "CombatErrors.hpp"
#include <algorithm>
#include <cmath>

static const double BAND_EPSILON = 1e-9;

void validateAccuracy(double accuracy, const char* label) {
	if (!std::isfinite(accuracy) || accuracy < 0.0 || accuracy > 1.0) {
		throw ValidationError(std::string(label) + " must be within [0,1]");
	}
}

void validateBands(const WeaponBandConfig& bands) {
	for (HitZone zone : ALL_ZONES) {
		double w = bands.width(zone);
		if (!std::isfinite(w) || w < 0.0) {
			throw ValidationError(std::string("Band width for ") + zoneName(zone) + " must be a non-negative number");
		}
	}
	if (bands.total() > DIAL_DEGREES + BAND_EPSILON) {
		throw ValidationError("Weapon bands exceed 360 degrees");
	}
}

WeaponBandConfig adjustBandsForAccuracy(const WeaponBandConfig& bands, double accuracy, double scaleMax) {
	validateBands(bands);
	validateAccuracy(accuracy, "Accuracy");

	const double scale = 1.0 + std::max(0.0, scaleMax) * accuracy;

	WeaponBandConfig adjusted = bands;
	adjusted.degInjure = bands.degInjure / scale;
	adjusted.degMiss = bands.degMiss / scale;

	const double freed = (bands.degInjure + bands.degMiss) - (adjusted.degInjure + adjusted.degMiss);
	const double growPool = bands.degNormal + bands.degCrit;
	if (growPool > 0.0) {
		adjusted.degNormal = bands.degNormal + freed * (bands.degNormal / growPool);
		adjusted.degCrit = bands.degCrit + freed * (bands.degCrit / growPool);
	}
	else {
		adjusted.degNormal = bands.degNormal + freed;
	}

	return adjusted;
}

HitZone zoneForDegree(double tapDegrees, const WeaponBandConfig& adjustedBands) {
	if (!std::isfinite(tapDegrees) || tapDegrees < 0.0 || tapDegrees >= DIAL_DEGREES) {
		throw ValidationError("Tap position must be within [0,360) degrees");
	}

	double upper = 0.0;
	for (HitZone zone : ALL_ZONES) {
		upper += adjustedBands.width(zone);
		if (tapDegrees < upper) {
			return zone;
		}
	}

	// A full dial whose rescaled widths sum a hair under 360 still ends on its last band.
	if (adjustedBands.total() >= DIAL_DEGREES - BAND_EPSILON) {
		for (std::size_t i = sizeof(ALL_ZONES) / sizeof(ALL_ZONES[0]); i-- > 0; ) {
			if (adjustedBands.width(ALL_ZONES[i]) > 0.0) return ALL_ZONES[i];
		}
	}
	return HitZone::Injure;
}

HitZone resolveZone(double tapDegrees, const WeaponBandConfig& bands, double accuracy, double scaleMax) {
	return zoneForDegree(tapDegrees, adjustBandsForAccuracy(bands, accuracy, scaleMax));
}
