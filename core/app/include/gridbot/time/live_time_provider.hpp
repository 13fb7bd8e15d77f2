#pragma once

#include "gridbot/time/i_time_provider.hpp"

namespace gridbot {

// Wall-clock time source used by the production binary.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace gridbot
