#include "cmdline.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "cxxopts.hpp"

#include "extended_newick.h"
#include "version.h"

namespace phylotraits {

auto process_args(int argc, char** argv) -> Processed_cmd_line {
  cxxopts::Options options("phylotraits", "Phylotraits - Trait evolution and regression on phylogenetic networks");

  options.add_options("Generic options")
      ("version", "print version string")
      ("h,help", "print usage")
      ;

  options.add_options("Input")
      ("network", "Rooted phylogenetic network in extended Newick format", cxxopts::value<std::string>())
      ("traits", "Comma-separated trait table, with a 'tipNames' column naming the taxon of each row",
       cxxopts::value<std::string>())
      ("no-names", "Ignore tip names: rows of the trait table are assumed to be in network tip order (dangerous)",
       cxxopts::value<bool>()->default_value("false"))
      ;

  options.add_options("Regression")
      ("response", "Column of the trait table to use as response", cxxopts::value<std::string>())
      ("predictors", "Comma-separated columns of the trait table to use as predictors",
       cxxopts::value<std::vector<std::string>>())
      ("no-intercept", "Fit without an intercept", cxxopts::value<bool>()->default_value("false"))
      ("model", "Evolutionary model: BM, lambda (Pagel's lambda) or scalingHybrid",
       cxxopts::value<std::string>()->default_value("BM"))
      ("fixed-value", "Fix the transformation parameter of the lambda or scalingHybrid model instead of estimating it",
       cxxopts::value<double>())
      ("starting-value", "Starting value of the transformation parameter in the optimization",
       cxxopts::value<double>()->default_value("0.5"))
      ("ancestral", "Reconstruct ancestral states from the fit (intercept-only models)",
       cxxopts::value<bool>()->default_value("false"))
      ("level", "Level of the confidence and prediction intervals",
       cxxopts::value<double>()->default_value("0.95"))
      ;

  options.add_options("Simulation")
      ("simulate", "Simulate a BM trait on the network and print it as a trait table",
       cxxopts::value<bool>()->default_value("false"))
      ("mu", "Value of the trait at the root", cxxopts::value<double>()->default_value("0.0"))
      ("sigma2", "Variance rate of the BM", cxxopts::value<double>()->default_value("1.0"))
      ("seed", "Random number seed (default: random)", cxxopts::value<std::uint32_t>())
      ;

  try {
    auto opts = options.parse(argc, argv);

    if (opts.count("version")) {
      std::cout << absl::StreamFormat("Phylotraits Version %s (build %d, commit %s)",
                                      k_phylotraits_version_string,
                                      k_phylotraits_build_number,
                                      k_phylotraits_commit_string) << "\n";
      std::exit(EXIT_SUCCESS);
    }
    if (opts.count("help")) {
      std::cout << options.help() << "\n";
      std::exit(EXIT_SUCCESS);
    }

    // Network
    if (opts.count("network") == 0) {
      std::cerr << "ERROR: No input network given (--network)\n";
      std::exit(EXIT_FAILURE);
    }
    auto network_filename = opts["network"].as<std::string>();
    auto network_is = std::ifstream{network_filename};
    if (not network_is) {
      std::cerr << "ERROR: Could not read input network file " << network_filename << "\n";
      std::exit(EXIT_FAILURE);
    }
    std::cerr << "Reading network file " << network_filename << "\n";
    auto net = read_extended_newick(network_is);
    std::cerr << absl::StreamFormat("Read network with %d tips and %d hybrid nodes\n",
                                    net.num_tips(), net.num_hybrids());

    auto simulate = opts["simulate"].as<bool>();
    if (not simulate && opts.count("traits") == 0) {
      std::cerr << "ERROR: Nothing to do: give a trait table to fit (--traits) or ask for a simulation (--simulate)\n";
      std::exit(EXIT_FAILURE);
    }
    if (simulate && opts.count("traits") > 0) {
      std::cerr << "ERROR: The options --simulate and --traits are mutually exclusive.  Pick one.\n";
      std::exit(EXIT_FAILURE);
    }

    auto level = opts["level"].as<double>();
    if (not (level > 0.0 && level < 1.0)) {
      std::cerr << "ERROR: Level must be strictly between 0 and 1, got " << level << "\n";
      std::exit(EXIT_FAILURE);
    }

    // Simulation parameters
    auto sim_params = Params_bm{
      .mu = opts["mu"].as<double>(),
      .sigma2 = opts["sigma2"].as<double>()
    };
    if (sim_params.sigma2 <= 0.0) {
      std::cerr << "ERROR: Variance rate must be positive, got " << sim_params.sigma2 << "\n";
      std::exit(EXIT_FAILURE);
    }

    auto seed = std::uint32_t{};
    if (opts.count("seed")) {
      seed = opts["seed"].as<std::uint32_t>();
    } else {
      seed = std::random_device{}();
    }
    if (simulate) {
      std::cerr << "# Seed: " << seed << "\n";
    }

    // Regression
    auto traits = std::optional<Trait_table>{};
    auto formula = Trait_formula{};
    auto lm_options = Phylo_lm_options{};
    if (opts.count("traits") > 0) {
      auto traits_filename = opts["traits"].as<std::string>();
      auto traits_is = std::ifstream{traits_filename};
      if (not traits_is) {
        std::cerr << "ERROR: Could not read trait table " << traits_filename << "\n";
        std::exit(EXIT_FAILURE);
      }
      std::cerr << "Reading trait table " << traits_filename << "\n";
      traits = read_trait_table(traits_is);
      std::cerr << absl::StreamFormat("Read %d rows with columns %s\n",
                                      traits->num_rows(), absl::StrJoin(traits->column_names, ", "));

      if (opts.count("response") == 0) {
        std::cerr << "ERROR: No response column given (--response)\n";
        std::exit(EXIT_FAILURE);
      }
      formula.response = opts["response"].as<std::string>();
      if (opts.count("predictors")) {
        formula.predictors = opts["predictors"].as<std::vector<std::string>>();
      }
      formula.intercept = not opts["no-intercept"].as<bool>();
      for (const auto& column : formula.predictors) {
        if (not traits->has_column(column)) {
          std::cerr << "ERROR: Predictor '" << column << "' is not a column of the trait table\n";
          std::exit(EXIT_FAILURE);
        }
      }
      if (not traits->has_column(formula.response)) {
        std::cerr << "ERROR: Response '" << formula.response << "' is not a column of the trait table\n";
        std::exit(EXIT_FAILURE);
      }

      try {
        lm_options.model = parse_trait_model(opts["model"].as<std::string>());
      } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        std::exit(EXIT_FAILURE);
      }

      if (opts.count("fixed-value") > 0) {
        if (lm_options.model == Trait_model::k_bm) {
          std::cerr << "ERROR: --fixed-value only makes sense for the lambda and scalingHybrid models\n";
          std::exit(EXIT_FAILURE);
        }
        lm_options.fixed_value = opts["fixed-value"].as<double>();
      }
      lm_options.starting_value = opts["starting-value"].as<double>();

    } else {
      if (opts.count("response") > 0 || opts.count("predictors") > 0 || opts.count("fixed-value") > 0 ||
          opts["ancestral"].as<bool>() || opts["no-names"].as<bool>()) {
        std::cerr << "ERROR: Regression options need a trait table (--traits)\n";
        std::exit(EXIT_FAILURE);
      }
    }

    return {
      .net = std::move(net),
      .traits = std::move(traits),
      .formula = std::move(formula),
      .lm_options = std::move(lm_options),
      .ignore_names = opts["no-names"].as<bool>(),
      .ancestral = opts["ancestral"].as<bool>(),
      .level = level,
      .simulate = simulate,
      .sim_params = std::move(sim_params),
      .seed = seed
    };

  } catch (cxxopts::exceptions::exception& x) {
    std::cerr << "ERROR: " << x.what() << "\n" << options.help() << "\n";
    std::exit(EXIT_FAILURE);
  }
}

}  // namespace phylotraits
