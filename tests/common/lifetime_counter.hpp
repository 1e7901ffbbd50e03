#pragma once

#include <stdexcept>
#include <utility>

namespace genarena::test {

// Tallies every constructor and destructor run of Tracked values, moved-from
// shells included. A leak leaves Live() above the expected count; a double
// release drives it below.
struct LifetimeCounts {
  int constructed = 0;
  int destroyed = 0;

  [[nodiscard]] auto Live() const -> int {
    return constructed - destroyed;
  }
};

class Tracked {
 public:
  Tracked(LifetimeCounts* counts, int id) : counts_(counts), id_(id) {
    ++counts_->constructed;
  }
  Tracked(const Tracked& other) : counts_(other.counts_), id_(other.id_) {
    ++counts_->constructed;
  }
  Tracked(Tracked&& other) noexcept
      : counts_(other.counts_), id_(std::exchange(other.id_, -1)) {
    ++counts_->constructed;
  }
  auto operator=(const Tracked&) -> Tracked& = default;
  auto operator=(Tracked&& other) noexcept -> Tracked& {
    counts_ = other.counts_;
    id_ = std::exchange(other.id_, -1);
    return *this;
  }
  ~Tracked() {
    ++counts_->destroyed;
  }

  [[nodiscard]] auto Id() const -> int {
    return id_;
  }

 private:
  LifetimeCounts* counts_;
  int id_;
};

// Shared move allowance for FragileMove values. Negative means unlimited;
// a move attempted at zero throws.
struct MoveBudget {
  int moves_left = -1;
};

class FragileMove {
 public:
  FragileMove(MoveBudget* budget, int id) : budget_(budget), id_(id) {
  }
  FragileMove(FragileMove&& other) : budget_(other.budget_), id_(other.id_) {
    if (budget_->moves_left == 0) {
      throw std::runtime_error("move");
    }
    if (budget_->moves_left > 0) {
      --budget_->moves_left;
    }
  }
  auto operator=(FragileMove&&) -> FragileMove& = delete;
  ~FragileMove() = default;

  [[nodiscard]] auto Id() const -> int {
    return id_;
  }

 private:
  MoveBudget* budget_;
  int id_;
};

}  // namespace genarena::test
