#pragma once

#include "airsense/core/feature_window.hpp"
#include "airsense/models/isignal.hpp"
#include "airsense/utils/logging.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace airsense::models {

/**
 * @struct TreeNode
 * @brief One node of a regression tree.
 *
 * Internal nodes route a vector left when its @c feature is <= @c threshold.
 * Leaves have no children and carry the prediction in @c value.
 */
struct TreeNode {
	int feature = -1;
	double threshold = 0.0;
	int left = -1;
	int right = -1;
	double value = 0.0;

	bool isLeaf() const {
		return left < 0 && right < 0;
	}
};

/**
 * @struct DecisionTree
 * @brief Flat array of nodes; node 0 is the root.
 */
struct DecisionTree {
	std::vector<TreeNode> nodes;

	/**
	 * @brief Walks the tree for @p features and returns the leaf value.
	 */
	double evaluate(const core::FeatureVector &features) const;

	/**
	 * @brief Checks that the tree is well formed.
	 *
	 * Every child index must point forward in the node array, which also
	 * rules out cycles; feature indices must address a FeatureVector.
	 *
	 * @throws std::invalid_argument describing the first problem found.
	 */
	void validate() const;
};

/**
 * @enum TreeAggregation
 * @brief How the outputs of the individual trees are combined.
 */
enum class TreeAggregation {
	/// Mean of all trees (random forest).
	Average,
	/// base_score + learning_rate * sum of all trees (gradient boosting).
	Boosted
};

/**
 * @class TreeEnsemble
 * @brief Immutable, pre-trained ensemble of regression trees.
 *
 * Ensembles are trained offline and shipped as a text artifact:
 *
 * ```
 * airsense-trees 1
 * aggregation average|boosted
 * base_score <double>
 * learning_rate <double>
 * trees <count>
 * tree <node-count>
 * <index> <feature> <threshold> <left> <right> <value>
 * ...
 * ```
 */
class TreeEnsemble {
public:
	/**
	 * @throws std::invalid_argument if @p trees is empty or any tree is malformed.
	 */
	TreeEnsemble(TreeAggregation aggregation, std::vector<DecisionTree> trees, double base_score = 0.0,
	             double learning_rate = 1.0);

	/**
	 * @brief Reads an artifact from @p path.
	 * @throws std::runtime_error if the file cannot be opened or parsed.
	 */
	static TreeEnsemble load(const std::string &path);

	/**
	 * @brief Reads an artifact from a stream.
	 * @throws std::runtime_error on malformed input.
	 */
	static TreeEnsemble parse(std::istream &in);

	double predict(const core::FeatureVector &features) const;

	TreeAggregation getAggregation() const {
		return aggregation_;
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

	double getBaseScore() const {
		return base_score_;
	}

	double getLearningRate() const {
		return learning_rate_;
	}

private:
	TreeAggregation aggregation_;
	std::vector<DecisionTree> trees_;
	double base_score_;
	double learning_rate_;
};

class TreeEnsembleSignalBuilder;

/**
 * @class TreeEnsembleSignal
 * @brief Point-estimator signal: evaluates a tree ensemble on the latest vector of the window.
 *
 * A signal built without an ensemble reports a failure on every call, which
 * the forecaster replaces with its fallback value.
 */
class TreeEnsembleSignal final : public ISignal {
public:
	friend class TreeEnsembleSignalBuilder;

	double predict(const core::FeatureWindow &window) const override;

	std::string getName() const override {
		return name_;
	}

	bool isLoaded() const {
		return static_cast<bool>(ensemble_);
	}

private:
	TreeEnsembleSignal(std::string name, std::shared_ptr<const TreeEnsemble> ensemble);

	std::string name_;
	std::shared_ptr<const TreeEnsemble> ensemble_;
};

/**
 * @class TreeEnsembleSignalBuilder
 * @brief A builder for TreeEnsembleSignal.
 */
class TreeEnsembleSignalBuilder {
public:
	TreeEnsembleSignalBuilder &withName(std::string name);

	/// Uses an ensemble that is already in memory.
	TreeEnsembleSignalBuilder &withEnsemble(std::shared_ptr<const TreeEnsemble> ensemble);

	/**
	 * @brief Loads the ensemble from an artifact at build time.
	 *
	 * A missing or unreadable artifact is logged and leaves the signal
	 * unloaded rather than failing the build.
	 */
	TreeEnsembleSignalBuilder &withModelFile(std::string path);

	std::unique_ptr<TreeEnsembleSignal> build();

private:
	std::string name_ = "TreeEnsemble";
	std::shared_ptr<const TreeEnsemble> ensemble_;
	std::optional<std::string> model_path_;
};

} // namespace airsense::models
