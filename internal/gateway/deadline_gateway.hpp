#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "banking_gateway.hpp"

namespace waterfall::gateway {

/*
  Bounds every call to the wrapped gateway by a timeout.

  Each call runs on a worker thread. If the deadline passes the caller gets
  util::GatewayError with Timeout() set straight away, but the worker stays
  owned here: the next call, AwaitIdle() and the destructor all join it first.
  At most one call reaches the wrapped gateway at any time. A timed-out
  transfer is never reported as a success.

  Non-gateway exceptions from the wrapped gateway are rethrown as
  util::GatewayError.
*/
class DeadlineGateway final : public BankingGateway {
 public:
  DeadlineGateway(std::shared_ptr<BankingGateway> inner, std::chrono::milliseconds timeout);
  ~DeadlineGateway() override;

  DeadlineGateway(const DeadlineGateway&)            = delete;
  DeadlineGateway& operator=(const DeadlineGateway&) = delete;

  util::Amount            GetMainBalance() override;
  std::vector<model::Pot> ListPots() override;
  TransferStatus          TransferToPot(const std::string& pot_id, util::Amount amount) override;
  void                    AwaitIdle() override;

  std::chrono::milliseconds Timeout() const {
    return timeout_;
  }

 private:
  template <typename Fn>
  auto Call(std::string_view operation, Fn fn) -> decltype(fn(std::declval<BankingGateway&>()));

  // Requires mutex_.
  void JoinAbandoned();

  std::shared_ptr<BankingGateway> inner_;
  std::chrono::milliseconds       timeout_;

  std::mutex  mutex_;
  std::thread abandoned_;
  std::string abandoned_operation_;
};

} // namespace waterfall::gateway
