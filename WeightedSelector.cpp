// File: WeightedSelector.cpp
// Description: Cumulative-weight draws without replacement.
#include "WeightedSelector.hpp"
#include "CombatErrors.hpp"
#include <cmath>

RollFn makeRoll(std::mt19937& gen) {
	return [&gen]() {
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		return dist(gen);
	};
}

static double clampRoll(double r) {
	if (!(r >= 0.0)) return 0.0; // also catches NaN
	if (r >= 1.0) return std::nextafter(1.0, 0.0);
	return r;
}

std::vector<std::size_t> selectWeightedIndices(const std::vector<double>& weights, int count, const RollFn& roll) {
	std::vector<std::size_t> picked;
	if (count <= 0 || weights.empty()) return picked;

	std::vector<std::size_t> remaining;
	remaining.reserve(weights.size());
	for (std::size_t i = 0; i < weights.size(); ++i) {
		if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
			throw ValidationError("Weighted entry " + std::to_string(i) + " has an invalid weight");
		}
		if (weights[i] > 0.0) remaining.push_back(i);
	}

	while (static_cast<int>(picked.size()) < count && !remaining.empty()) {
		double total = 0.0;
		for (std::size_t idx : remaining) total += weights[idx];
		if (total <= 0.0) break;

		double target = clampRoll(roll()) * total;

		// Strict '<' so a roll landing on a boundary goes to the later entry and
		// an exact tie between equal weights is decided by insertion order.
		std::size_t chosen = remaining.size() - 1;
		double cumulative = 0.0;
		for (std::size_t k = 0; k < remaining.size(); ++k) {
			cumulative += weights[remaining[k]];
			if (target < cumulative) {
				chosen = k;
				break;
			}
		}

		picked.push_back(remaining[chosen]);
		remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(chosen));
	}

	return picked;
}

std::vector<WeightedEntry> selectWeighted(const std::vector<WeightedEntry>& pool, int count, const RollFn& roll) {
	std::vector<double> weights;
	weights.reserve(pool.size());
	for (const auto& entry : pool) weights.push_back(entry.weight);

	std::vector<WeightedEntry> out;
	for (std::size_t idx : selectWeightedIndices(weights, count, roll)) {
		out.push_back(pool[idx]);
	}
	return out;
}

int rollInt(const RollFn& roll, int lo, int hi) {
	if (hi <= lo) return lo;
	int span = hi - lo + 1;
	int offset = static_cast<int>(clampRoll(roll()) * span);
	if (offset >= span) offset = span - 1;
	return lo + offset;
}
