#include "phylo_lm.h"

#include <cmath>
#include <numbers>
#include <random>
#include <sstream>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "extended_newick.h"
#include "matrix_matchers.h"
#include "simulation.h"
#include "test_networks.h"
#include "warning_collector.h"

namespace phylotraits {

// GLS by explicit inversion of the tip covariance
struct Naive_gls {
  Eigen::VectorXd coef;
  double deviance;
  double loglik;
  Eigen::MatrixXd vcov;

  Naive_gls(const Eigen::MatrixXd& X, const Eigen::VectorXd& Y, const Eigen::MatrixXd& V) {
    auto n = static_cast<double>(Y.size());
    Eigen::MatrixXd Vinv = V.inverse();
    Eigen::MatrixXd XtVinvX_inv = (X.transpose() * Vinv * X).inverse();
    coef = XtVinvX_inv * X.transpose() * Vinv * Y;
    Eigen::VectorXd r = Y - X * coef;
    deviance = r.dot(Vinv * r);
    loglik = -n / 2 * (std::log(2 * std::numbers::pi * deviance / n) + 1) - 0.5 * std::log(V.determinant());
    vcov = deviance / (n - static_cast<double>(X.cols())) * XtVinvX_inv;
  }
};

class Phylo_lm_test : public testing::Test {
 protected:
  Network net = read_extended_newick(k_six_tips);
  Topological_matrix V = calc_shared_path_matrix(net);
  Eigen::VectorXd Y{{1.2, 0.4, 2.5, 3.1, -0.7, 1.9}};
  Eigen::VectorXd x{{0.5, 1.0, 1.5, 2.0, 2.5, 3.0}};

  auto design() const -> Eigen::MatrixXd {
    auto X = Eigen::MatrixXd(6, 2);
    X.col(0).setOnes();
    X.col(1) = x;
    return X;
  }
  auto intercept_only() const -> Eigen::MatrixXd { return Eigen::MatrixXd::Ones(6, 1); }
};

TEST_F(Phylo_lm_test, bm_matches_naive_gls) {
  auto X = design();
  auto fit = phylo_network_lm(X, Y, net);
  auto naive = Naive_gls{X, Y, V.tips()};

  EXPECT_THAT(fit.model(), testing::Eq(Trait_model::k_bm));
  EXPECT_THAT(fit.nobs(), testing::Eq(6));
  EXPECT_THAT(fit.num_coefficients(), testing::Eq(2));
  EXPECT_THAT(fit.dof_residual(), testing::Eq(4));
  EXPECT_THAT(fit.dof(), testing::Eq(3));

  EXPECT_THAT(fit.coef(), matrix_double_near(naive.coef, 1e-9));
  EXPECT_THAT(fit.deviance(), testing::DoubleNear(naive.deviance, 1e-9));
  EXPECT_THAT(fit.sigma2_estim(), testing::DoubleNear(naive.deviance / 6, 1e-9));
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(naive.loglik, 1e-9));
  EXPECT_THAT(fit.vcov(), matrix_double_near(naive.vcov, 1e-9));
  EXPECT_THAT(fit.stderror(), matrix_double_near(naive.vcov.diagonal().cwiseSqrt().eval(), 1e-9));

  Eigen::VectorXd fitted = X * naive.coef;
  EXPECT_THAT(fit.predict(), matrix_double_near(fitted, 1e-9));
  EXPECT_THAT(fit.residuals(), matrix_double_near((Y - fitted).eval(), 1e-9));

  EXPECT_THAT(fit.Vy(), matrix_double_near(V.tips(), 1e-12));
  Eigen::MatrixXd LLt = fit.L() * fit.L().transpose();
  EXPECT_THAT(LLt, matrix_double_near(V.tips(), 1e-12));
  EXPECT_THAT(fit.logdet_Vy(), testing::DoubleNear(std::log(V.tips().determinant()), 1e-9));
}

TEST_F(Phylo_lm_test, information_criteria) {
  auto fit = phylo_network_lm(design(), Y, net);
  auto ll = fit.loglikelihood();
  EXPECT_THAT(fit.aic(), testing::DoubleNear(-2 * ll + 2 * 3, 1e-9));
  EXPECT_THAT(fit.aicc(), testing::DoubleNear(-2 * ll + 2 * 3 + 2.0 * 3 * 4 / (6 - 3 - 1), 1e-9));
  EXPECT_THAT(fit.bic(), testing::DoubleNear(-2 * ll + 3 * std::log(6.0), 1e-9));
}

TEST_F(Phylo_lm_test, null_model) {
  auto fit = phylo_network_lm(design(), Y, net);
  auto null_fit = phylo_network_lm(intercept_only(), Y, net);

  EXPECT_THAT(fit.null_deviance(), testing::DoubleNear(null_fit.deviance(), 1e-9));
  EXPECT_THAT(null_fit.loglikelihood(), testing::DoubleNear(null_fit.null_loglikelihood(), 1e-9));
  EXPECT_THAT(fit.null_loglikelihood(), testing::DoubleNear(null_fit.loglikelihood(), 1e-9));
  EXPECT_THAT(null_fit.r2(), testing::DoubleNear(0.0, 1e-9));

  auto r2 = 1.0 - fit.deviance() / null_fit.deviance();
  EXPECT_THAT(fit.r2(), testing::DoubleNear(r2, 1e-9));
  EXPECT_THAT(fit.adjr2(), testing::DoubleNear(1.0 - (1.0 - r2) * 5.0 / 4.0, 1e-9));
}

TEST_F(Phylo_lm_test, confidence_intervals) {
  auto fit = phylo_network_lm(design(), Y, net);
  auto ci = fit.confint();
  auto se = fit.stderror();

  // 97.5% quantile of Student's t with 4 degrees of freedom
  auto q = 2.7764451051977987;
  for (auto j = 0; j != 2; ++j) {
    EXPECT_THAT(ci(j, 0), testing::DoubleNear(fit.coef()(j) - q * se(j), 1e-8));
    EXPECT_THAT(ci(j, 1), testing::DoubleNear(fit.coef()(j) + q * se(j), 1e-8));
  }

  auto narrow = fit.confint(0.5);
  EXPECT_THAT(narrow(1, 1) - narrow(1, 0), testing::Lt(ci(1, 1) - ci(1, 0)));

  EXPECT_THROW((void)fit.confint(0.0), std::invalid_argument);
  EXPECT_THROW((void)fit.confint(1.0), std::invalid_argument);
}

TEST_F(Phylo_lm_test, coef_table) {
  auto options = Phylo_lm_options{.coef_names = {"(Intercept)", "x"}, .has_intercept = true};
  auto fit = phylo_network_lm(design(), Y, net, options);
  auto table = fit.coef_table();

  EXPECT_THAT(table.names, testing::ElementsAre("(Intercept)", "x"));
  EXPECT_THAT(table.level, testing::DoubleEq(0.95));
  for (auto j = 0; j != 2; ++j) {
    EXPECT_THAT(table.t_value(j), testing::DoubleNear(table.estimate(j) / table.std_error(j), 1e-12));
    EXPECT_THAT(table.p_value(j), testing::AllOf(testing::Gt(0.0), testing::Le(1.0)));
  }

  auto os = std::ostringstream{};
  os << fit;
  EXPECT_THAT(os.str(), testing::HasSubstr("model: BM"));
  EXPECT_THAT(os.str(), testing::HasSubstr("(Intercept)"));
  EXPECT_THAT(os.str(), testing::HasSubstr("Lower 95%"));
  EXPECT_THAT(os.str(), testing::Not(testing::HasSubstr("Lambda")));
}

TEST_F(Phylo_lm_test, coef_names) {
  auto fit = phylo_network_lm(design(), Y, net);
  EXPECT_THAT(fit.coef_names(), testing::ElementsAre("x1", "x2"));
  EXPECT_THROW(fit.set_coef_names({"a"}), std::invalid_argument);
}

TEST_F(Phylo_lm_test, reordered_rows) {
  auto X = design();
  auto fit = phylo_network_lm(X, Y, net);

  // Row k of the data holds the tip at position perm[k]
  auto perm = std::vector<int>{3, 0, 5, 1, 4, 2};
  auto Xp = Eigen::MatrixXd(6, 2);
  auto Yp = Eigen::VectorXd(6);
  for (auto k = 0; k != 6; ++k) {
    Xp.row(k) = X.row(perm[k]);
    Yp(k) = Y(perm[k]);
  }
  auto fit_p = phylo_network_lm(Xp, Yp, net, Phylo_lm_options{.reorder = perm});

  EXPECT_THAT(fit_p.coef(), matrix_double_near(fit.coef(), 1e-9));
  EXPECT_THAT(fit_p.loglikelihood(), testing::DoubleNear(fit.loglikelihood(), 1e-9));
  EXPECT_THAT(fit_p.residuals()(0), testing::DoubleNear(fit.residuals()(3), 1e-9));
  EXPECT_THAT(fit_p.deviance(), testing::DoubleNear(fit.deviance(), 1e-9));
  EXPECT_THAT(fit_p.null_deviance(), testing::DoubleNear(fit.null_deviance(), 1e-9));
  EXPECT_THAT(fit_p.sigma2_estim(), testing::DoubleNear(fit.sigma2_estim(), 1e-9));
  EXPECT_THAT(fit_p.r2(), testing::DoubleNear(fit.r2(), 1e-9));
  EXPECT_THAT(fit_p.adjr2(), testing::DoubleNear(fit.adjr2(), 1e-9));
  EXPECT_THAT(fit_p.aic(), testing::DoubleNear(fit.aic(), 1e-9));
  EXPECT_THAT(fit_p.aicc(), testing::DoubleNear(fit.aicc(), 1e-9));
  EXPECT_THAT(fit_p.bic(), testing::DoubleNear(fit.bic(), 1e-9));
  EXPECT_THAT(fit_p.stderror(), matrix_double_near(fit.stderror(), 1e-9));
}

TEST_F(Phylo_lm_test, missing_tips) {
  auto observed = std::vector<bool>{true, true, false, true, true, true};
  auto X = Eigen::MatrixXd(5, 2);
  auto Yo = Eigen::VectorXd(5);
  for (auto i = 0, k = 0; i != 6; ++i) {
    if (observed[i]) {
      X(k, 0) = 1.0;
      X(k, 1) = x(i);
      Yo(k) = Y(i);
      ++k;
    }
  }
  auto fit = phylo_network_lm(X, Yo, net, Phylo_lm_options{.observed = observed});
  auto naive = Naive_gls{X, Yo, V.tips({}, observed)};

  EXPECT_THAT(fit.nobs(), testing::Eq(5));
  EXPECT_THAT(fit.coef(), matrix_double_near(naive.coef, 1e-9));
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(naive.loglik, 1e-9));
}

TEST_F(Phylo_lm_test, no_coefficients) {
  auto X = Eigen::MatrixXd(6, 0);
  auto fit = phylo_network_lm(X, Y, net);

  EXPECT_THAT(fit.num_coefficients(), testing::Eq(0));
  EXPECT_THAT(fit.coef().size(), testing::Eq(0));
  EXPECT_THAT(fit.deviance(), testing::DoubleNear(Y.dot(V.tips().inverse() * Y), 1e-9));
  EXPECT_THAT(fit.predict(), matrix_double_near(Eigen::VectorXd::Zero(6).eval(), 1e-12));
  EXPECT_THAT(fit.residuals(), matrix_double_near(Y, 1e-9));
  EXPECT_THAT(fit.vcov().size(), testing::Eq(0));
  EXPECT_THAT(fit.confint().rows(), testing::Eq(0));
  EXPECT_THROW((void)fit.mu_estim(), std::invalid_argument);

  auto os = std::ostringstream{};
  os << fit;
  EXPECT_THAT(os.str(), testing::HasSubstr("expected value is fixed at 0"));
}

TEST_F(Phylo_lm_test, mu_estim) {
  auto collector = Warning_collector{};
  auto fit = phylo_network_lm(design(), Y, net);
  EXPECT_THAT(fit.mu_estim(collector.hook()), testing::DoubleEq(fit.coef()(0)));
  EXPECT_THAT(collector.count<Trait_warnings::Mu_from_first_coefficient>(), testing::Eq(1));

  fit.set_has_intercept(true);
  EXPECT_THAT(fit.mu_estim(collector.hook()), testing::DoubleEq(fit.coef()(0)));
  EXPECT_THAT(collector.warnings, testing::SizeIs(1));

  fit.set_has_intercept(false);
  EXPECT_THROW((void)fit.mu_estim(collector.hook()), std::invalid_argument);
}

TEST_F(Phylo_lm_test, bad_dimensions) {
  EXPECT_THROW((void)phylo_network_lm(Eigen::MatrixXd::Ones(5, 1), Y, net), std::invalid_argument);
  EXPECT_THROW((void)phylo_network_lm(Eigen::MatrixXd::Ones(5, 1), Y.head(5).eval(), net), std::invalid_argument);
  EXPECT_THROW(
      (void)phylo_network_lm(intercept_only(), Y, net, Phylo_lm_options{.observed = {true, true, false}}),
      std::invalid_argument);
  EXPECT_THROW(
      (void)phylo_network_lm(intercept_only(), Y, net,
                             Phylo_lm_options{.observed = {true, true, false, true, true, true}}),
      std::invalid_argument);
}

TEST(Phylo_lm_saturated_test, prints_without_intervals) {
  auto net = read_extended_newick("(A:1,B:1);");
  auto X = Eigen::MatrixXd{{1.0, 0.5}, {1.0, 2.0}};
  auto Y = Eigen::VectorXd{{1.0, 4.0}};
  auto fit = phylo_network_lm(X, Y, net);

  EXPECT_THAT(fit.dof_residual(), testing::Eq(0));
  EXPECT_THAT(fit.coef(), matrix_double_near(Eigen::VectorXd{{0.0, 2.0}}, 1e-9));
  EXPECT_TRUE(fit.stderror().array().isNaN().all());
  EXPECT_TRUE(fit.confint().array().isNaN().all());

  auto table = fit.coef_table();
  EXPECT_THAT(table.estimate, matrix_double_near(fit.coef(), 1e-12));
  EXPECT_TRUE(table.t_value.array().isNaN().all());
  EXPECT_TRUE(table.p_value.array().isNaN().all());

  auto os = std::ostringstream{};
  EXPECT_NO_THROW(os << fit);
  EXPECT_THAT(os.str(), testing::HasSubstr("Coefficients:"));
}

TEST_F(Phylo_lm_test, collinear_design) {
  auto X = Eigen::MatrixXd(6, 3);
  X.col(0).setOnes();
  X.col(1) = x;
  X.col(2) = 2.0 * x;
  EXPECT_THROW((void)phylo_network_lm(X, Y, net), std::invalid_argument);
  EXPECT_THROW(
      (void)phylo_network_lm(X, Y, net, Phylo_lm_options{.model = Trait_model::k_lambda}),
      std::invalid_argument);
}

TEST(Phylo_lm_singular_test, tips_at_zero_distance) {
  auto net = read_extended_newick("((A:0,B:0):1,C:1);");
  auto Y = Eigen::VectorXd{{1.0, 2.0, 3.0}};
  EXPECT_THROW((void)phylo_network_lm(Eigen::MatrixXd::Ones(3, 1), Y, net), std::runtime_error);
}

TEST_F(Phylo_lm_test, lambda_fixed_at_one_is_bm) {
  auto bm = phylo_network_lm(design(), Y, net);
  auto options = Phylo_lm_options{.model = Trait_model::k_lambda, .fixed_value = 1.0};
  auto lam = phylo_network_lm(design(), Y, net, options);

  EXPECT_THAT(lam.model(), testing::Eq(Trait_model::k_lambda));
  EXPECT_THAT(lam.lambda_estim(), testing::DoubleEq(1.0));
  EXPECT_FALSE(lam.optimization().has_value());
  EXPECT_THAT(lam.coef(), matrix_double_near(bm.coef(), 1e-9));
  EXPECT_THAT(lam.loglikelihood(), testing::DoubleNear(bm.loglikelihood(), 1e-9));
  EXPECT_THAT(lam.dof(), testing::Eq(bm.dof() + 1));
  EXPECT_THAT(lam.aic(), testing::DoubleNear(bm.aic() + 2, 1e-9));
}

TEST_F(Phylo_lm_test, lambda_fixed) {
  auto options = Phylo_lm_options{.model = Trait_model::k_lambda, .fixed_value = 0.4};
  auto fit = phylo_network_lm(design(), Y, net, options);

  auto V_lambda = lambda_transformed(V, 0.4, calc_lambda_transform_weights(net));
  auto naive = Naive_gls{design(), Y, V_lambda.tips()};
  EXPECT_THAT(fit.coef(), matrix_double_near(naive.coef, 1e-9));
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(naive.loglik, 1e-9));

  auto os = std::ostringstream{};
  os << fit;
  EXPECT_THAT(os.str(), testing::HasSubstr("Lambda: 0.4"));
}

TEST_F(Phylo_lm_test, lambda_optimized) {
  auto options = Phylo_lm_options{.model = Trait_model::k_lambda};
  auto fit = phylo_network_lm(design(), Y, net, options);

  ASSERT_TRUE(fit.optimization().has_value());
  EXPECT_THAT(fit.lambda_estim(), testing::DoubleEq(fit.optimization()->x_min));
  EXPECT_THAT(fit.lambda_estim(), testing::Gt(0.0));
  EXPECT_THAT(fit.lambda_estim(), testing::Lt(max_lambda(V, calc_lambda_transform_weights(net))));
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(-fit.optimization()->f_min, 1e-9));

  for (const auto& lambda : {0.01, 0.25, 0.5, 0.75, 1.0}) {
    auto fixed = Phylo_lm_options{.model = Trait_model::k_lambda, .fixed_value = lambda};
    EXPECT_THAT(fit.loglikelihood(), testing::Ge(phylo_network_lm(design(), Y, net, fixed).loglikelihood() - 1e-6))
        << "lambda = " << lambda;
  }
}

TEST_F(Phylo_lm_test, lambda_bounds) {
  auto options = Phylo_lm_options{.model = Trait_model::k_lambda, .lambda_lower_bound = 10.0};
  EXPECT_THROW((void)phylo_network_lm(design(), Y, net, options), std::invalid_argument);
}

TEST_F(Phylo_lm_test, scaling_hybrid) {
  auto options = Phylo_lm_options{.model = Trait_model::k_scaling_hybrid};
  auto fit = phylo_network_lm(design(), Y, net, options);

  EXPECT_THAT(fit.model(), testing::Eq(Trait_model::k_scaling_hybrid));
  ASSERT_TRUE(fit.optimization().has_value());
  auto naive = Naive_gls{design(), Y, calc_scaled_hybrid_matrix(net, fit.lambda_estim()).tips()};
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(naive.loglik, 1e-9));

  for (const auto& lambda : {0.0, 0.5, 1.0}) {
    auto fixed = Phylo_lm_options{.model = Trait_model::k_scaling_hybrid, .fixed_value = lambda};
    EXPECT_THAT(fit.loglikelihood(), testing::Ge(phylo_network_lm(design(), Y, net, fixed).loglikelihood() - 1e-6))
        << "lambda = " << lambda;
  }
}

TEST(Phylo_lm_scaling_hybrid_test, tree_falls_back_to_bm) {
  auto net = read_extended_newick(k_three_tip_tree);
  auto Y = Eigen::VectorXd{{1.0, 1.5, -0.5}};
  auto X = Eigen::MatrixXd::Ones(3, 1).eval();
  auto collector = Warning_collector{};

  auto fit = phylo_network_lm(X, Y, net, Phylo_lm_options{.model = Trait_model::k_scaling_hybrid}, collector.hook());
  auto bm = phylo_network_lm(X, Y, net);

  EXPECT_THAT(collector.count<Trait_warnings::No_hybrids_to_scale>(), testing::Eq(1));
  EXPECT_THAT(fit.lambda_estim(), testing::DoubleEq(1.0));
  EXPECT_FALSE(fit.optimization().has_value());
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(bm.loglikelihood(), 1e-12));

  // No hybrid weight to scale, so no extra parameter is counted
  EXPECT_FALSE(fit.lambda_in_model());
  EXPECT_THAT(fit.dof(), testing::Eq(bm.dof()));
  EXPECT_THAT(fit.aic(), testing::DoubleNear(bm.aic(), 1e-12));
  EXPECT_THAT(fit.bic(), testing::DoubleNear(bm.bic(), 1e-12));
}

TEST_F(Phylo_lm_test, anova) {
  auto small = phylo_network_lm(intercept_only(), Y, net);
  auto large = phylo_network_lm(design(), Y, net);
  auto table = anova({&small, &large});

  ASSERT_THAT(table.rows, testing::SizeIs(1));
  const auto& row = table.rows[0];
  EXPECT_THAT(row.dof_res, testing::Eq(4));
  EXPECT_THAT(row.dof, testing::Eq(1));
  EXPECT_THAT(row.rss, testing::DoubleNear(large.deviance(), 1e-12));
  EXPECT_THAT(row.ss, testing::DoubleNear(small.deviance() - large.deviance(), 1e-12));
  EXPECT_THAT(row.F, testing::DoubleNear((small.deviance() - large.deviance()) / (large.deviance() / 4), 1e-9));
  EXPECT_THAT(row.p_value, testing::AllOf(testing::Ge(0.0), testing::Le(1.0)));

  // With one extra coefficient, the F test agrees with the t test on that coefficient
  auto t = large.coef_table().t_value(1);
  EXPECT_THAT(row.F, testing::DoubleNear(t * t, 1e-8));
  EXPECT_THAT(row.p_value, testing::DoubleNear(large.coef_table().p_value(1), 1e-8));

  auto os = std::ostringstream{};
  os << table;
  EXPECT_THAT(os.str(), testing::HasSubstr("Pr(>F)"));
}

TEST_F(Phylo_lm_test, anova_errors) {
  auto small = phylo_network_lm(intercept_only(), Y, net);
  auto large = phylo_network_lm(design(), Y, net);
  EXPECT_THROW((void)anova({&large, &small}), std::invalid_argument);
  EXPECT_THROW((void)anova({&large}), std::invalid_argument);
}

TEST(Phylo_lm_simulated_test, intercept_only_is_its_own_null_model) {
  auto net = read_extended_newick("(A:2.5,((B:1,#H1:0.5::0.1):1,(C:1,(D:0.5)#H1:0.5::0.9):1):0.5);");
  auto prng = std::mt19937_64{2018};
  auto sim = simulate(net, Params_bm{.mu = 10.0, .sigma2 = 1.0}, prng);
  Eigen::VectorXd Y = sim.tips();

  auto fit = phylo_network_lm(Eigen::MatrixXd::Ones(4, 1), Y, net);
  EXPECT_THAT(fit.loglikelihood(), testing::DoubleNear(fit.null_loglikelihood(), 1e-10));
  EXPECT_THAT(fit.deviance(), testing::DoubleNear(fit.null_deviance(), 1e-10));
}

TEST(Trait_model_test, names) {
  for (const auto& model : {Trait_model::k_bm, Trait_model::k_lambda, Trait_model::k_scaling_hybrid}) {
    EXPECT_THAT(parse_trait_model(to_string(model)), testing::Eq(model));
  }
  EXPECT_THAT(to_string(Trait_model::k_scaling_hybrid), testing::Eq("scalingHybrid"));
  EXPECT_THROW((void)parse_trait_model("OU"), std::invalid_argument);
}

}  // namespace phylotraits
