#pragma once

#include <equimint/cli/options.hpp>
#include <ostream>

namespace equimint::cli {

inline constexpr auto kExitOk = 0;
inline constexpr auto kExitRejected = 1;
inline constexpr auto kExitUsage = 2;

/// Run one parsed command against the RocksDB store named in `options`.
/// Results go to `out`, rejections to `err`.
int run(const settings& options, std::ostream& out, std::ostream& err);

}  // namespace equimint::cli
