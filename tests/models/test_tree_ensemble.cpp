#include <catch2/catch.hpp>

#include "airsense/models/tree_ensemble.hpp"
#include "common/forecast_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace airsense::models;
using airsense::core::FeatureVector;
using airsense::core::WeatherReading;
using tests::fixtures::aqiWindow;

namespace {

// Tree 1 splits on AQI at 100 (80 / 200); tree 2 is a single leaf of 120.
const char *kForestArtifact = R"(airsense-trees 1
aggregation average
base_score 0
learning_rate 1
trees 2
tree 3
0 0 100 1 2 0
1 -1 0 -1 -1 80
2 -1 0 -1 -1 200
tree 1
0 -1 0 -1 -1 120
)";

const char *kBoostArtifact = R"(airsense-trees 1
aggregation boosted
base_score 10
learning_rate 0.5
trees 2
tree 3
0 0 100 1 2 0
1 -1 0 -1 -1 80
2 -1 0 -1 -1 200
tree 1
0 -1 0 -1 -1 120
)";

TreeEnsemble parseText(const std::string &text) {
	std::istringstream in(text);
	return TreeEnsemble::parse(in);
}

FeatureVector withAqi(double aqi) {
	return FeatureVector::synthesize(aqi, WeatherReading {});
}

} // namespace

TEST_CASE("Random forest artifact averages its trees", "[models][tree_ensemble]") {
	const auto forest = parseText(kForestArtifact);

	REQUIRE(forest.getAggregation() == TreeAggregation::Average);
	REQUIRE(forest.treeCount() == 2);
	REQUIRE(forest.predict(withAqi(50.0)) == Catch::Detail::Approx(100.0));
	REQUIRE(forest.predict(withAqi(100.0)) == Catch::Detail::Approx(100.0));
	REQUIRE(forest.predict(withAqi(150.0)) == Catch::Detail::Approx(160.0));
}

TEST_CASE("Boosted artifact scales the tree sum", "[models][tree_ensemble]") {
	const auto boost = parseText(kBoostArtifact);

	REQUIRE(boost.getAggregation() == TreeAggregation::Boosted);
	REQUIRE(boost.getBaseScore() == 10.0);
	REQUIRE(boost.getLearningRate() == 0.5);
	REQUIRE(boost.predict(withAqi(50.0)) == Catch::Detail::Approx(10.0 + 0.5 * 200.0));
	REQUIRE(boost.predict(withAqi(150.0)) == Catch::Detail::Approx(10.0 + 0.5 * 320.0));
}

TEST_CASE("Malformed artifacts are rejected", "[models][tree_ensemble]") {
	SECTION("wrong header") {
		REQUIRE_THROWS_AS(parseText("not-a-model 1"), std::runtime_error);
	}
	SECTION("unsupported version") {
		REQUIRE_THROWS_AS(parseText("airsense-trees 2"), std::runtime_error);
	}
	SECTION("unknown aggregation") {
		REQUIRE_THROWS_AS(parseText("airsense-trees 1\naggregation median\n"), std::runtime_error);
	}
	SECTION("truncated node list") {
		REQUIRE_THROWS_AS(parseText("airsense-trees 1\naggregation average\nbase_score 0\nlearning_rate 1\n"
		                            "trees 1\ntree 3\n0 0 100 1 2 0\n"),
		                  std::runtime_error);
	}
	SECTION("child pointing backwards") {
		REQUIRE_THROWS_AS(parseText("airsense-trees 1\naggregation average\nbase_score 0\nlearning_rate 1\n"
		                            "trees 1\ntree 2\n0 0 100 1 0 0\n1 -1 0 -1 -1 5\n"),
		                  std::runtime_error);
	}
	SECTION("unknown feature") {
		REQUIRE_THROWS_AS(parseText("airsense-trees 1\naggregation average\nbase_score 0\nlearning_rate 1\n"
		                            "trees 1\ntree 3\n0 12 100 1 2 0\n1 -1 0 -1 -1 5\n2 -1 0 -1 -1 6\n"),
		                  std::runtime_error);
	}
}

TEST_CASE("Decision tree validation", "[models][tree_ensemble]") {
	DecisionTree empty;
	REQUIRE_THROWS_AS(empty.validate(), std::invalid_argument);
	REQUIRE_THROWS_AS(TreeEnsemble(TreeAggregation::Average, {}), std::invalid_argument);

	DecisionTree leaf;
	leaf.nodes.push_back(TreeNode {-1, 0.0, -1, -1, 42.0});
	REQUIRE_NOTHROW(leaf.validate());
	REQUIRE(leaf.evaluate(withAqi(1.0)) == 42.0);
}

TEST_CASE("Tree ensemble signal evaluates the latest vector", "[models][tree_ensemble]") {
	auto forest = std::make_shared<const TreeEnsemble>(parseText(kForestArtifact));
	auto signal = TreeEnsembleSignalBuilder().withName("RandomForest").withEnsemble(forest).build();

	REQUIRE(signal->isLoaded());
	REQUIRE(signal->getName() == "RandomForest");
	REQUIRE(signal->predict(aqiWindow({50.0, 60.0, 150.0})) == Catch::Detail::Approx(160.0));
}

TEST_CASE("Tree ensemble signal loads an artifact from disk", "[models][tree_ensemble]") {
	const auto path = std::filesystem::temp_directory_path() / "airsense_forest_test.trees";
	{
		std::ofstream out(path);
		out << kForestArtifact;
	}

	auto signal = TreeEnsembleSignalBuilder().withName("RandomForest").withModelFile(path.string()).build();
	std::filesystem::remove(path);

	REQUIRE(signal->isLoaded());
	REQUIRE(signal->predict(aqiWindow({50.0})) == Catch::Detail::Approx(100.0));
}

TEST_CASE("Unloaded tree ensemble signal fails every prediction", "[models][tree_ensemble]") {
	auto signal = TreeEnsembleSignalBuilder()
	                  .withName("GradientBoosting")
	                  .withModelFile("/nonexistent/airsense/boost.trees")
	                  .build();

	REQUIRE_FALSE(signal->isLoaded());
	REQUIRE_THROWS_AS(signal->predict(aqiWindow({100.0})), std::runtime_error);
	REQUIRE_THROWS_AS(TreeEnsemble::load("/nonexistent/airsense/boost.trees"), std::runtime_error);
}
