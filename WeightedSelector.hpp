// File: WeightedSelector.hpp
// Description: Weighted random picks for enemy pools, loot pools, styles and
// rarities. Pure apart from the injected roll function.
#pragma once

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

// Returns a uniform value in [0, 1). Tests inject scripted sequences.
using RollFn = std::function<double()>;

// Wraps a generator owned by the caller; the generator must outlive the RollFn.
RollFn makeRoll(std::mt19937& gen);

struct WeightedEntry {
	std::string referenceId;
	double weight = 0.0;
	int tier = 1;
	std::optional<std::string> styleId;
};

/**
 * @brief Draws up to `count` distinct positions from `weights` without
 * replacement. Each draw picks with probability proportional to the weight
 * still in the pool. Zero weights are never picked; ties go to the earlier
 * position. Returns fewer than `count` when the pool runs dry.
 * @throws ValidationError on a negative or non-finite weight.
 */
std::vector<std::size_t> selectWeightedIndices(const std::vector<double>& weights, int count, const RollFn& roll);

// Entry-level form. Duplicate referenceIds are separate, independently eligible entries.
std::vector<WeightedEntry> selectWeighted(const std::vector<WeightedEntry>& pool, int count, const RollFn& roll);

// Uniform integer in [lo, hi] drawn from the same roll source.
int rollInt(const RollFn& roll, int lo, int hi);
