#ifndef TAGTREE_CORE_CONFIG_H
#define TAGTREE_CORE_CONFIG_H

#include <cstddef>

namespace tagtree::core::config {

inline constexpr std::size_t kDefaultMaxNestingDepth = 512;
inline constexpr const char kProgramName[] = "tagtree";
inline constexpr const char kVersionString[] = "tagtree 0.1.0";

}  // namespace tagtree::core::config

#endif  // TAGTREE_CORE_CONFIG_H
