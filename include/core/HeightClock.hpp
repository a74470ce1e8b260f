/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEIGHT_CLOCK_HPP
#define HEIGHT_CLOCK_HPP

#include "core/LedgerTypes.hpp"
#include <atomic>

namespace LatticeMint {

/**
 * @brief Monotonically increasing height used to timestamp ledger records
 */
class IHeightClock {
public:
  virtual ~IHeightClock() = default;
  virtual Height currentHeight() const = 0;
};

/**
 * @brief Height counter advanced explicitly by its owner
 */
class ManualHeightClock : public IHeightClock {
public:
  explicit ManualHeightClock(Height start = 1) : m_height(start) {}

  Height currentHeight() const override {
    return m_height.load(std::memory_order_acquire);
  }

  // Returns the new height
  Height advance(Height blocks = 1) {
    return m_height.fetch_add(blocks, std::memory_order_acq_rel) + blocks;
  }

private:
  std::atomic<Height> m_height;
};

} // namespace LatticeMint

#endif // HEIGHT_CLOCK_HPP
