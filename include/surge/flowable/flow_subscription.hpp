#pragma once
#include <cstdint>
#include <memory>

namespace surge {

// Demand channel between one subscriber and one demand-aware source.
// request(n) adds n to the outstanding demand (saturating at surge::unbounded);
// cancel() is idempotent and may be called from any thread.
class flow_subscription {
public:
  virtual ~flow_subscription() = default;
  virtual void request(std::int64_t n) = 0;
  virtual void cancel() noexcept = 0;
};

using flow_subscription_ptr = std::shared_ptr<flow_subscription>;

namespace detail {

// Handed out when a source fails before it could supply a real subscription.
class empty_flow_subscription final : public flow_subscription {
public:
  void request(std::int64_t) override {}
  void cancel() noexcept override {}
};

} // namespace detail
} // namespace surge
