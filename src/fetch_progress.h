#pragma once

#include <cstdint>
#include <functional>
#include <optional>

namespace provy {

struct fetch_transfer_progress {
  std::uint64_t transferred{ 0 };
  std::optional<std::uint64_t> total;
};

// Return false to abort the transfer.
using fetch_progress_cb_t = std::function<bool(fetch_transfer_progress const &)>;

}  // namespace provy
