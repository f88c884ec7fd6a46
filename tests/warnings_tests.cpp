#include "warnings.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace phylotraits {

TEST(Warnings_test, describe) {
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Default_hybrid_gammas{.hybrid_label = "H1"}),
              testing::AllOf(testing::HasSubstr("H1"), testing::HasSubstr("0.9")));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Complementary_hybrid_gamma{.hybrid_label = "H2", .given_gamma = 0.3}),
              testing::AllOf(testing::HasSubstr("H2"), testing::HasSubstr("0.3"), testing::HasSubstr("0.7")));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Tree_edge_gamma_ignored{.child_label = "A", .gamma = 0.5}),
              testing::HasSubstr("above A"));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Hybrid_polytomy_resolved{.hybrid_label = "H1", .num_children = 3}),
              testing::HasSubstr("3 children"));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Unreadable_trait_value{.line = 4, .column = "x", .text = "abc"}),
              testing::Eq("line 4: value 'abc' in column 'x' treated as missing"));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::Variance_rate_uncertainty_ignored{}),
              testing::HasSubstr("variance rate"));
  EXPECT_THAT(describe_trait_warning(Trait_warnings::No_hybrids_to_scale{}),
              testing::HasSubstr("no hybrid nodes"));
}

TEST(Warnings_test, every_warning_is_described) {
  auto warnings = std::vector<Trait_warning>{
    Trait_warnings::Default_hybrid_gammas{},
    Trait_warnings::Complementary_hybrid_gamma{},
    Trait_warnings::Tree_edge_gamma_ignored{},
    Trait_warnings::Hybrid_polytomy_resolved{},
    Trait_warnings::Variance_rate_uncertainty_ignored{},
    Trait_warnings::Tip_order_assumed{},
    Trait_warnings::Mu_from_first_coefficient{},
    Trait_warnings::Tip_names_ignored{},
    Trait_warnings::Unreadable_trait_value{},
    Trait_warnings::No_hybrids_to_scale{}};
  EXPECT_THAT(warnings.size(), testing::Eq(std::variant_size_v<Trait_warning>));
  for (const auto& w : warnings) {
    EXPECT_THAT(describe_trait_warning(w), testing::Not(testing::IsEmpty()));
  }
}

TEST(Warnings_test, default_hook_prints_to_stderr) {
  testing::internal::CaptureStderr();
  default_trait_warning_hook(Trait_warnings::Tip_order_assumed{});
  auto output = testing::internal::GetCapturedStderr();
  EXPECT_THAT(output, testing::StartsWith("WARNING: "));
  EXPECT_THAT(output, testing::HasSubstr("tip order"));
  EXPECT_THAT(output, testing::EndsWith("\n"));
}

}  // namespace phylotraits
