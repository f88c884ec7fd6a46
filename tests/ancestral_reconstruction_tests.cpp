#include "ancestral_reconstruction.h"

#include <cmath>
#include <sstream>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "extended_newick.h"
#include "matrix_matchers.h"
#include "test_networks.h"
#include "warning_collector.h"

namespace phylotraits {

static auto index_of_number(const std::vector<int>& numbers, int number) -> int {
  auto index = estd::ranges::index_of(numbers, number);
  EXPECT_THAT(index, testing::Ne(-1)) << "No node number " << number;
  return index;
}

TEST(Ancestral_reconstruction_test, two_tip_star) {
  auto net = read_extended_newick("(A:2,B:2);");
  auto Y = Eigen::VectorXd{{1.0, 3.0}};
  auto fit = phylo_network_lm(Eigen::MatrixXd::Ones(2, 1), Y, net);
  auto collector = Warning_collector{};
  auto states = ancestral_state_reconstruction(fit, collector.hook());

  // Mean 2, deviance (1 - 3)^2 / (2 * 2) = 1, variance of the root mean 1 * 2 / 2 = 1
  ASSERT_THAT(states.node_numbers(), testing::ElementsAre(-1));
  EXPECT_THAT(states.traits_nodes()(0), testing::DoubleNear(2.0, 1e-12));
  EXPECT_THAT(states.variances_nodes()(0, 0), testing::DoubleNear(1.0, 1e-12));
  EXPECT_THAT(states.dof_residual(), testing::Optional(1));

  auto intervals = states.predint();
  ASSERT_THAT(intervals.rows(), testing::Eq(3));
  auto q = 12.706204736174705;  // 97.5% quantile of Student's t with 1 degree of freedom
  EXPECT_THAT(intervals(0, 0), testing::DoubleNear(2.0 - q, 1e-8));
  EXPECT_THAT(intervals(0, 1), testing::DoubleNear(2.0 + q, 1e-8));

  // Observed tips get degenerate intervals
  EXPECT_THAT(intervals(1, 0), testing::DoubleEq(1.0));
  EXPECT_THAT(intervals(1, 1), testing::DoubleEq(1.0));
  EXPECT_THAT(intervals(2, 0), testing::DoubleEq(3.0));
  EXPECT_THAT(intervals(2, 1), testing::DoubleEq(3.0));

  auto expectations = states.expectations();
  EXPECT_THAT(expectations.node_numbers, testing::ElementsAre(-1, 1, 2));
  EXPECT_THAT(expectations.cond_expectation, matrix_double_near(Eigen::VectorXd{{2.0, 1.0, 3.0}}, 1e-12));

  EXPECT_THAT(collector.count<Trait_warnings::Tip_order_assumed>(), testing::Eq(1));
  EXPECT_THAT(collector.count<Trait_warnings::Variance_rate_uncertainty_ignored>(), testing::Eq(1));
}

TEST(Ancestral_reconstruction_test, known_parameters) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto Y = Eigen::VectorXd{{1.0, 3.0, 2.0}};
  auto states = ancestral_state_reconstruction(net, Y, Params_bm{});

  EXPECT_FALSE(states.dof_residual().has_value());
  ASSERT_THAT(states.node_numbers(), testing::UnorderedElementsAre(-1, -2));
  auto r = index_of_number(states.node_numbers(), -1);
  auto x = index_of_number(states.node_numbers(), -2);

  // The root value is known; x is informed by A and B only
  EXPECT_THAT(states.traits_nodes()(r), testing::DoubleNear(0.0, 1e-12));
  EXPECT_THAT(states.variances_nodes()(r, r), testing::DoubleNear(0.0, 1e-12));
  EXPECT_THAT(states.traits_nodes()(x), testing::DoubleNear(4.0 / 3.0, 1e-12));
  EXPECT_THAT(states.variances_nodes()(x, x), testing::DoubleNear(1.0 / 3.0, 1e-12));
  EXPECT_THAT(states.stderror()(x), testing::DoubleNear(std::sqrt(1.0 / 3.0), 1e-12));

  auto q = 1.959963984540054;  // 97.5% quantile of the standard normal
  auto intervals = states.predint();
  EXPECT_THAT(intervals(x, 0), testing::DoubleNear(4.0 / 3.0 - q * std::sqrt(1.0 / 3.0), 1e-8));
  EXPECT_THAT(intervals(x, 1), testing::DoubleNear(4.0 / 3.0 + q * std::sqrt(1.0 / 3.0), 1e-8));

  EXPECT_THAT(states.tip_numbers(), testing::ElementsAre(1, 2, 3));
  EXPECT_THAT(states.traits_tips(), matrix_double_near(Y, 1e-12));
}

TEST(Ancestral_reconstruction_test, known_parameters_with_shift_and_rate) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto x_node = net.parents_of(node_named(net, "A")).at(0);
  auto Y = Eigen::VectorXd{{1.0, 3.0, 2.0}};
  auto params = Params_bm{.sigma2 = 2.0, .shift = Shift_net{{x_node}, {1.0}, net}};
  auto states = ancestral_state_reconstruction(net, Y, params);

  auto x = index_of_number(states.node_numbers(), -2);
  EXPECT_THAT(states.traits_nodes()(x), testing::DoubleNear(1.0 + 2.0 / 3.0, 1e-12));
  EXPECT_THAT(states.variances_nodes()(x, x), testing::DoubleNear(2.0 / 3.0, 1e-12));
}

TEST(Ancestral_reconstruction_test, known_parameters_errors) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto Y = Eigen::VectorXd{{1.0, 3.0, 2.0}};
  EXPECT_THROW((void)ancestral_state_reconstruction(net, Y, Params_bm{.random_root = true, .var_root = 1.0}),
               std::invalid_argument);
  EXPECT_THROW((void)ancestral_state_reconstruction(net, Y.head(2).eval(), Params_bm{}), std::invalid_argument);
  EXPECT_THROW((void)ancestral_state_reconstruction(net, Y, Params_bm{.sigma2 = 0.0}), std::invalid_argument);

  auto other = read_extended_newick(k_one_hybrid);
  EXPECT_THROW((void)ancestral_state_reconstruction(net, Y, Params_bm{.shift = Shift_net{other}}),
               std::invalid_argument);
}

TEST(Ancestral_reconstruction_test, fitted_agrees_with_known_expectations) {
  auto net = read_extended_newick(k_six_tips);
  auto Y = Eigen::VectorXd{{1.2, 0.4, 2.5, 3.1, -0.7, 1.9}};
  auto fit = phylo_network_lm(Eigen::MatrixXd::Ones(6, 1), Y, net,
                              Phylo_lm_options{.reorder = {0, 1, 2, 3, 4, 5}, .has_intercept = true});
  auto collector = Warning_collector{};
  auto fitted = ancestral_state_reconstruction(fit, collector.hook());
  auto known = ancestral_state_reconstruction(net, Y, Params_bm{.mu = fit.coef()(0), .sigma2 = fit.sigma2_estim()});

  EXPECT_THAT(collector.count<Trait_warnings::Tip_order_assumed>(), testing::Eq(0));
  EXPECT_THAT(fitted.node_numbers(), testing::ElementsAreArray(known.node_numbers()));
  EXPECT_THAT(fitted.traits_nodes(), matrix_double_near(known.traits_nodes(), 1e-9));

  // Uncertainty on the mean only adds variance
  Eigen::VectorXd extra = fitted.variances_nodes().diagonal() - known.variances_nodes().diagonal();
  for (auto i = 0; i != extra.size(); ++i) {
    EXPECT_THAT(extra(i), testing::Ge(-1e-12));
  }
  auto root = index_of_number(fitted.node_numbers(), -1);
  EXPECT_THAT(extra(root), testing::DoubleNear(fit.vcov()(0, 0), 1e-12));
}

TEST(Ancestral_reconstruction_test, missing_tip) {
  auto net = read_extended_newick(k_one_hybrid);
  auto Y = Eigen::VectorXd{{1.0, 2.0}};
  auto options = Phylo_lm_options{.observed = {true, false, true}, .reorder = {0, 1, 2}};
  auto fit = phylo_network_lm(Eigen::MatrixXd::Ones(2, 1), Y, net, options);
  auto states = ancestral_state_reconstruction(fit);

  ASSERT_THAT(states.node_numbers(), testing::SizeIs(5));
  EXPECT_THAT(states.node_numbers().back(), testing::Eq(2));
  EXPECT_THAT(states.tip_numbers(), testing::ElementsAre(1, 3));

  // B is predicted from A (through the major edge) and C (through the minor edge)
  auto mu = fit.coef()(0);
  auto Vy = Eigen::MatrixXd{{2.0, 0.0}, {0.0, 2.0}};
  auto Vby = Eigen::RowVectorXd{{0.6, 0.4}};
  auto b_pred = mu + (Vby * Vy.inverse() * (Y - Eigen::VectorXd::Constant(2, mu))).value();
  EXPECT_THAT(states.traits_nodes()(4), testing::DoubleNear(b_pred, 1e-9));

  auto intervals = states.predint(0.9);
  EXPECT_THAT(intervals(4, 1) - intervals(4, 0), testing::Gt(0.0));
  EXPECT_THAT(intervals(5, 1) - intervals(5, 0), testing::DoubleEq(0.0));
}

TEST(Ancestral_reconstruction_test, predictors_at_nodes) {
  auto net = read_extended_newick(k_six_tips);
  auto Y = Eigen::VectorXd{{1.2, 0.4, 2.5, 3.1, -0.7, 1.9}};
  auto X = Eigen::MatrixXd(6, 2);
  X.col(0).setOnes();
  X.col(1) << 0.5, 1.0, 1.5, 2.0, 2.5, 3.0;
  auto fit = phylo_network_lm(X, Y, net);

  // Only a plain intercept can be extended to the internal nodes
  EXPECT_THROW((void)ancestral_state_reconstruction(fit), std::invalid_argument);

  auto num_internal = fit.V().num_internal_nodes();
  auto X_n = Eigen::MatrixXd(num_internal, 2);
  X_n.col(0).setOnes();
  X_n.col(1).setConstant(1.0);
  auto states = ancestral_state_reconstruction(fit, X_n, [](const Trait_warning&) {});
  EXPECT_THAT(states.node_numbers(), testing::SizeIs(num_internal));

  EXPECT_THROW((void)ancestral_state_reconstruction(fit, Eigen::MatrixXd::Ones(num_internal, 1).eval()),
               std::invalid_argument);
  EXPECT_THROW((void)ancestral_state_reconstruction(fit, Eigen::MatrixXd::Ones(num_internal + 1, 2).eval()),
               std::invalid_argument);
}

TEST(Ancestral_reconstruction_test, bad_level) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto states = ancestral_state_reconstruction(net, Eigen::VectorXd{{1.0, 3.0, 2.0}}, Params_bm{});
  EXPECT_THROW((void)states.predint(0.0), std::invalid_argument);
  EXPECT_THROW((void)states.predint(1.5), std::invalid_argument);
}

TEST(Ancestral_reconstruction_test, print) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto states = ancestral_state_reconstruction(net, Eigen::VectorXd{{1.0, 3.0, 2.0}}, Params_bm{});
  auto os = std::ostringstream{};
  os << states;
  EXPECT_THAT(os.str(), testing::HasSubstr("Node index"));
  EXPECT_THAT(os.str(), testing::HasSubstr("Max. (95%)"));
}

}  // namespace phylotraits
