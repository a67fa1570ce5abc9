#include <sevclass/app/classification_session.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace sevclass::app {

LatestResultSlot::Ticket LatestResultSlot::begin_request() {
  std::lock_guard lock(mutex_);
  return ++newest_;
}

bool LatestResultSlot::publish(Ticket ticket, ClassificationOutcome outcome) {
  std::lock_guard lock(mutex_);
  if (ticket != newest_) {
    return false;
  }
  published_ = ticket;
  outcome_ = std::move(outcome);
  return true;
}

std::optional<ClassificationOutcome> LatestResultSlot::latest() const {
  std::lock_guard lock(mutex_);
  if (published_ == 0 || published_ != newest_) {
    return std::nullopt;
  }
  return outcome_;
}

bool LatestResultSlot::pending() const {
  std::lock_guard lock(mutex_);
  return newest_ != 0 && published_ != newest_;
}

ClassificationSession::~ClassificationSession() {
  std::lock_guard lock(inflight_mutex_);
  for (auto& f : inflight_) {
    f.wait();
  }
}

std::shared_future<bool> ClassificationSession::submit(std::vector<std::byte> encoded) {
  const auto ticket = slot_.begin_request();
  std::shared_future<bool> done =
      std::async(std::launch::async,
                 [this, ticket, bytes = std::move(encoded)]() {
                   ClassificationOutcome outcome;
                   try {
                     outcome = pipeline_.run(bytes);
                   } catch (const std::exception&) {
                     outcome = std::unexpected(core::ClassifyError::StageFailed);
                   }
                   return slot_.publish(ticket, std::move(outcome));
                 })
          .share();

  std::lock_guard lock(inflight_mutex_);
  inflight_.erase(std::remove_if(inflight_.begin(), inflight_.end(),
                                 [](const std::shared_future<bool>& f) {
                                   return f.wait_for(std::chrono::seconds(0)) ==
                                          std::future_status::ready;
                                 }),
                  inflight_.end());
  inflight_.push_back(done);
  return done;
}

}  // namespace sevclass::app
