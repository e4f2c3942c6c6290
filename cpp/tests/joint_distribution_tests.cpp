#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>

#include "libbnx/errors.hpp"
#include "libbnx/joint_distribution.hpp"
#include "libbnx/network.hpp"

using Catch::Matchers::WithinAbs;

namespace {
libbnx::Network make_rain_network() {
    libbnx::Network net;
    net.add("Rain", {}, libbnx::CptSpec::prior({{"yes", 0.2}, {"no", 0.8}}))
        .add("Wet", {"Rain"},
             libbnx::CptSpec::rows({{"yes", {{"yes", 0.9}, {"no", 0.1}}}, {"no", {{"yes", 0.1}, {"no", 0.9}}}}));
    return net;
}
}  // namespace

TEST_CASE("JointDistributionBuilder enumerates the domain product", "[joint]") {
    auto net = make_rain_network();
    libbnx::JointDistributionBuilder builder;
    auto joint = builder.build(net);

    REQUIRE(libbnx::JointDistributionBuilder::candidate_row_count(net) == 4);
    REQUIRE(joint.size() == 4);
    REQUIRE(joint.row(0) == libbnx::Row{"yes", "yes"});
    REQUIRE(joint.row(1) == libbnx::Row{"yes", "no"});
    REQUIRE(joint.row(2) == libbnx::Row{"no", "yes"});
    REQUIRE(joint.row(3) == libbnx::Row{"no", "no"});
    REQUIRE_THROWS_AS(joint.row(4), std::out_of_range);

    REQUIRE_THAT(joint.probability({"yes", "yes"}), WithinAbs(0.18, 1e-12));
    REQUIRE_THAT(joint.probability({"yes", "no"}), WithinAbs(0.02, 1e-12));
    REQUIRE_THAT(joint.probability({"no", "yes"}), WithinAbs(0.08, 1e-12));
    REQUIRE_THAT(joint.probability({"no", "no"}), WithinAbs(0.72, 1e-12));
    REQUIRE_THAT(joint.sum(), WithinAbs(1.0, 1e-9));
    REQUIRE_THROWS_AS(joint.probability({"maybe", "yes"}), std::out_of_range);
}

TEST_CASE("JointDistributionBuilder sums to one for complete cpts", "[joint]") {
    libbnx::Network net;
    net.add("Burglary", {}, libbnx::CptSpec::prior(0.001))
        .add("Earthquake", {}, libbnx::CptSpec::prior(0.002))
        .add("Alarm", {"Burglary", "Earthquake"},
             libbnx::CptSpec::rows({{{true, true}, 0.95}, {{true, false}, 0.94}, {{false, true}, 0.29}, {{false, false}, 0.001}}))
        .add("JohnCalls", {"Alarm"}, libbnx::CptSpec::rows({{true, 0.90}, {false, 0.05}}))
        .add("MaryCalls", {"Alarm"}, libbnx::CptSpec::rows({{true, 0.70}, {false, 0.01}}));

    const auto& joint = net.joint_distribution();
    REQUIRE(joint.size() == 32);
    REQUIRE_THAT(joint.sum(), WithinAbs(1.0, 1e-9));
    for (Eigen::Index i = 0; i < joint.probabilities().size(); ++i) {
        REQUIRE(joint.probabilities()[i] >= 0.0);
        REQUIRE(joint.probabilities()[i] <= 1.0);
    }

    const double expected = 0.001 * 0.998 * 0.94 * 0.90 * 0.70;
    REQUIRE(joint.probability({true, false, true, true, true}) == Catch::Approx(expected));
    REQUIRE(libbnx::JointDistributionBuilder::row_probability(net, {true, false, true, true, true}) ==
            Catch::Approx(expected));
}

TEST_CASE("JointDistributionBuilder surfaces incomplete cpts", "[joint]") {
    libbnx::JointDistributionBuilder builder;

    SECTION("missing parent row") {
        libbnx::Network net;
        net.add("A", {}, libbnx::CptSpec::prior({{"x", 0.5}, {"y", 0.5}}))
            .add("B", {"A"}, libbnx::CptSpec::rows({{"x", 0.3}}));
        REQUIRE_THROWS_AS(builder.build(net), libbnx::MissingConditionalRow);
    }

    SECTION("outcome absent from one row") {
        libbnx::Network net;
        net.add("A", {}, libbnx::CptSpec::prior(0.5))
            .add("B", {"A"}, libbnx::CptSpec::rows({{true, {{"lo", 1.0}}}, {false, {{"hi", 1.0}}}}));
        REQUIRE(net.lookup("B").domain().size() == 2);
        REQUIRE_THROWS_AS(builder.build(net), std::out_of_range);
    }

    SECTION("empty network") {
        libbnx::Network net;
        REQUIRE_THROWS_AS(builder.build(net), std::invalid_argument);
    }
}

TEST_CASE("JointDistributionBuilder honors the row limit", "[joint]") {
    auto net = make_rain_network();

    libbnx::InferenceOptions options;
    options.max_joint_rows = 3;
    REQUIRE_THROWS_AS(libbnx::JointDistributionBuilder(options).build(net), std::length_error);

    options.max_joint_rows = 4;
    REQUIRE_NOTHROW(libbnx::JointDistributionBuilder(options).build(net));
}

TEST_CASE("Network caches its joint distribution", "[joint]") {
    auto net = make_rain_network();

    const auto& first = net.joint_distribution();
    const auto& second = net.joint_distribution();
    REQUIRE(&first == &second);

    net.add("Slippery", {"Wet"}, libbnx::CptSpec::rows({{"yes", 0.7}, {"no", 0.0}}));
    const auto& rebuilt = net.joint_distribution();
    REQUIRE(rebuilt.size() == 8);
    REQUIRE_THAT(rebuilt.sum(), WithinAbs(1.0, 1e-9));
}

TEST_CASE("JointDistribution rejects zero mass", "[joint]") {
    REQUIRE_THROWS_AS(libbnx::JointDistribution({libbnx::Row{true}}, Eigen::VectorXd::Zero(1)),
                      libbnx::ZeroTotalProbability);
    REQUIRE_THROWS_AS(libbnx::JointDistribution({libbnx::Row{true}}, Eigen::VectorXd::Zero(2)),
                      std::invalid_argument);
}
