#include "deadline_gateway.hpp"

#include <future>
#include <string>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::gateway {

using waterfall::observability::IntField;
using waterfall::observability::StringField;

DeadlineGateway::DeadlineGateway(std::shared_ptr<BankingGateway> inner, std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {
}

DeadlineGateway::~DeadlineGateway() {
  std::lock_guard<std::mutex> lock(mutex_);
  JoinAbandoned();
}

void DeadlineGateway::JoinAbandoned() {
  if (!abandoned_.joinable()) return;

  WATERFALL_LOG_DEBUG("Waiting for timed-out gateway call", {StringField("operation", abandoned_operation_)});
  abandoned_.join();
  abandoned_operation_.clear();
}

void DeadlineGateway::AwaitIdle() {
  std::lock_guard<std::mutex> lock(mutex_);
  JoinAbandoned();
  inner_->AwaitIdle();
}

template <typename Fn>
auto DeadlineGateway::Call(std::string_view operation, Fn fn) -> decltype(fn(std::declval<BankingGateway&>())) {
  using Result = decltype(fn(std::declval<BankingGateway&>()));

  std::lock_guard<std::mutex> lock(mutex_);
  JoinAbandoned();

  std::packaged_task<Result()> task([inner = inner_, fn = std::move(fn)]() { return fn(*inner); });
  auto                         future = task.get_future();
  std::thread                  worker(std::move(task));

  if (future.wait_for(timeout_) == std::future_status::timeout) {
    abandoned_           = std::move(worker);
    abandoned_operation_ = std::string(operation);
    WATERFALL_LOG_WARN("Gateway call timed out", {StringField("operation", operation), IntField("timeout_ms", timeout_.count())});
    throw util::GatewayError(std::string(operation) + " timed out after " + std::to_string(timeout_.count()) + "ms", true);
  }
  worker.join();

  try {
    return future.get();
  } catch (const util::GatewayError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::GatewayError(std::string(operation) + " failed: " + e.what());
  }
}

util::Amount DeadlineGateway::GetMainBalance() {
  return Call("GetMainBalance", [](BankingGateway& gateway) { return gateway.GetMainBalance(); });
}

std::vector<model::Pot> DeadlineGateway::ListPots() {
  return Call("ListPots", [](BankingGateway& gateway) { return gateway.ListPots(); });
}

TransferStatus DeadlineGateway::TransferToPot(const std::string& pot_id, util::Amount amount) {
  return Call("TransferToPot", [pot_id, amount](BankingGateway& gateway) { return gateway.TransferToPot(pot_id, amount); });
}

} // namespace waterfall::gateway
