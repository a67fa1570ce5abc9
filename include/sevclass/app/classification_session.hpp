#pragma once

#include <sevclass/app/pipeline_runner.hpp>
#include <sevclass/core/pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace sevclass::app {

/// Last-write-wins holder for the outcome shown to the caller.
/// Each request takes a ticket; a completion is kept only if no newer
/// request has started since, so a stale result never replaces a newer one.
class LatestResultSlot {
 public:
  using Ticket = std::uint64_t;

  /// Starts a request; supersedes every earlier ticket.
  Ticket begin_request();

  /// Stores outcome if ticket is still the newest request. Returns false if discarded.
  bool publish(Ticket ticket, ClassificationOutcome outcome);

  /// Outcome of the newest completed request, if it is the newest started one.
  [[nodiscard]] std::optional<ClassificationOutcome> latest() const;

  /// True while the newest request has not published.
  [[nodiscard]] bool pending() const;

 private:
  mutable std::mutex mutex_;
  Ticket newest_{0};
  Ticket published_{0};
  std::optional<ClassificationOutcome> outcome_;
};

/// Runs one request per submitted image on its own thread and publishes
/// the outcome through a LatestResultSlot. The pipeline must outlive the session.
class ClassificationSession {
 public:
  explicit ClassificationSession(const core::Pipeline& pipeline) : pipeline_(pipeline) {}

  ClassificationSession(const ClassificationSession&) = delete;
  ClassificationSession& operator=(const ClassificationSession&) = delete;

  /// Waits for requests still in flight.
  ~ClassificationSession();

  /// Takes ownership of the encoded image and starts classifying it.
  /// A run that throws is published as StageFailed.
  /// The future yields true if this request's outcome was published, false if a
  /// newer submit() superseded it.
  std::shared_future<bool> submit(std::vector<std::byte> encoded);

  [[nodiscard]] const LatestResultSlot& slot() const noexcept { return slot_; }

 private:
  const core::Pipeline& pipeline_;
  LatestResultSlot slot_;
  std::mutex inflight_mutex_;
  std::vector<std::shared_future<bool>> inflight_;
};

}  // namespace sevclass::app
