#include "airsense/models/tree_ensemble.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace airsense::models {

namespace {

constexpr const char *kArtifactTag = "airsense-trees";
constexpr int kArtifactVersion = 1;

template <typename T>
T readValue(std::istream &in, const std::string &expected_key) {
	std::string key;
	T value{};
	if (!(in >> key) || key != expected_key) {
		throw std::runtime_error("Tree artifact: expected '" + expected_key + "', found '" + key + "'.");
	}
	if (!(in >> value)) {
		throw std::runtime_error("Tree artifact: missing value for '" + expected_key + "'.");
	}
	return value;
}

TreeAggregation parseAggregation(const std::string &name) {
	if (name == "average") {
		return TreeAggregation::Average;
	}
	if (name == "boosted") {
		return TreeAggregation::Boosted;
	}
	throw std::runtime_error("Tree artifact: unknown aggregation '" + name + "'.");
}

} // namespace

double DecisionTree::evaluate(const core::FeatureVector &features) const {
	std::size_t index = 0;
	while (!nodes[index].isLeaf()) {
		const auto &node = nodes[index];
		const double x = features[static_cast<std::size_t>(node.feature)];
		index = static_cast<std::size_t>(x <= node.threshold ? node.left : node.right);
	}
	return nodes[index].value;
}

void DecisionTree::validate() const {
	if (nodes.empty()) {
		throw std::invalid_argument("Decision tree has no nodes.");
	}
	const int count = static_cast<int>(nodes.size());
	for (int i = 0; i < count; ++i) {
		const auto &node = nodes[static_cast<std::size_t>(i)];
		if (node.isLeaf()) {
			if (!std::isfinite(node.value)) {
				throw std::invalid_argument("Leaf " + std::to_string(i) + " has a non-finite value.");
			}
			continue;
		}
		if (node.left <= i || node.right <= i || node.left >= count || node.right >= count) {
			throw std::invalid_argument("Node " + std::to_string(i) + " has an invalid child index.");
		}
		if (node.feature < 0 || node.feature >= static_cast<int>(core::FeatureVector::kSize)) {
			throw std::invalid_argument("Node " + std::to_string(i) + " uses unknown feature " +
			                            std::to_string(node.feature) + ".");
		}
	}
}

TreeEnsemble::TreeEnsemble(TreeAggregation aggregation, std::vector<DecisionTree> trees, double base_score,
                           double learning_rate)
    : aggregation_(aggregation), trees_(std::move(trees)), base_score_(base_score), learning_rate_(learning_rate) {
	if (trees_.empty()) {
		throw std::invalid_argument("TreeEnsemble requires at least one tree.");
	}
	for (const auto &tree : trees_) {
		tree.validate();
	}
}

double TreeEnsemble::predict(const core::FeatureVector &features) const {
	double sum = 0.0;
	for (const auto &tree : trees_) {
		sum += tree.evaluate(features);
	}
	if (aggregation_ == TreeAggregation::Average) {
		return sum / static_cast<double>(trees_.size());
	}
	return base_score_ + learning_rate_ * sum;
}

TreeEnsemble TreeEnsemble::parse(std::istream &in) {
	std::string tag;
	int version = 0;
	if (!(in >> tag >> version) || tag != kArtifactTag) {
		throw std::runtime_error("Tree artifact: missing '" + std::string(kArtifactTag) + "' header.");
	}
	if (version != kArtifactVersion) {
		throw std::runtime_error("Tree artifact: unsupported version " + std::to_string(version) + ".");
	}

	const auto aggregation = parseAggregation(readValue<std::string>(in, "aggregation"));
	const auto base_score = readValue<double>(in, "base_score");
	const auto learning_rate = readValue<double>(in, "learning_rate");
	const auto tree_count = readValue<int>(in, "trees");
	if (tree_count <= 0) {
		throw std::runtime_error("Tree artifact: tree count must be positive.");
	}

	std::vector<DecisionTree> trees;
	trees.reserve(static_cast<std::size_t>(tree_count));
	for (int t = 0; t < tree_count; ++t) {
		const auto node_count = readValue<int>(in, "tree");
		if (node_count <= 0) {
			throw std::runtime_error("Tree artifact: tree " + std::to_string(t) + " has no nodes.");
		}
		DecisionTree tree;
		tree.nodes.resize(static_cast<std::size_t>(node_count));
		for (int i = 0; i < node_count; ++i) {
			int index = 0;
			TreeNode node;
			if (!(in >> index >> node.feature >> node.threshold >> node.left >> node.right >> node.value)) {
				throw std::runtime_error("Tree artifact: truncated node list in tree " + std::to_string(t) + ".");
			}
			if (index != i) {
				throw std::runtime_error("Tree artifact: node " + std::to_string(i) + " of tree " +
				                         std::to_string(t) + " is out of order.");
			}
			tree.nodes[static_cast<std::size_t>(i)] = node;
		}
		trees.push_back(std::move(tree));
	}

	try {
		return TreeEnsemble(aggregation, std::move(trees), base_score, learning_rate);
	} catch (const std::invalid_argument &e) {
		throw std::runtime_error(std::string("Tree artifact: ") + e.what());
	}
}

TreeEnsemble TreeEnsemble::load(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open tree artifact '" + path + "'.");
	}
	auto ensemble = parse(in);
	AIRSENSE_INFO("Loaded tree ensemble from '{}' ({} trees).", path, ensemble.treeCount());
	return ensemble;
}

TreeEnsembleSignal::TreeEnsembleSignal(std::string name, std::shared_ptr<const TreeEnsemble> ensemble)
    : name_(std::move(name)), ensemble_(std::move(ensemble)) {
}

double TreeEnsembleSignal::predict(const core::FeatureWindow &window) const {
	if (!ensemble_) {
		throw std::runtime_error("Model '" + name_ + "' is not loaded.");
	}
	return ensemble_->predict(window.latest());
}

TreeEnsembleSignalBuilder &TreeEnsembleSignalBuilder::withName(std::string name) {
	name_ = std::move(name);
	return *this;
}

TreeEnsembleSignalBuilder &TreeEnsembleSignalBuilder::withEnsemble(std::shared_ptr<const TreeEnsemble> ensemble) {
	ensemble_ = std::move(ensemble);
	return *this;
}

TreeEnsembleSignalBuilder &TreeEnsembleSignalBuilder::withModelFile(std::string path) {
	model_path_ = std::move(path);
	return *this;
}

std::unique_ptr<TreeEnsembleSignal> TreeEnsembleSignalBuilder::build() {
	auto ensemble = ensemble_;
	if (!ensemble && model_path_) {
		try {
			ensemble = std::make_shared<const TreeEnsemble>(TreeEnsemble::load(*model_path_));
		} catch (const std::exception &e) {
			AIRSENSE_WARN("Signal '{}' starts without a model: {}", name_, e.what());
		}
	}
	if (!ensemble) {
		AIRSENSE_DEBUG("Building signal '{}' without a loaded ensemble.", name_);
	}
	return std::unique_ptr<TreeEnsembleSignal>(new TreeEnsembleSignal(name_, std::move(ensemble)));
}

} // namespace airsense::models
