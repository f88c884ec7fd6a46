#ifndef PHYLOTRAITS_VERSION_H_
#define PHYLOTRAITS_VERSION_H_

#include <string>

namespace phylotraits {

extern const std::string k_phylotraits_version_string;
extern const int k_phylotraits_build_number;
extern const std::string k_phylotraits_commit_string;

}  // namespace phylotraits

#endif // PHYLOTRAITS_VERSION_H_
