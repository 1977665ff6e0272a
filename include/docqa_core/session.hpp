#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "docqa_core/index/corpus.hpp"

namespace docqa_core {

enum class SessionState { Empty, Ingesting, Ready };

std::string to_string(SessionState state);

/**
 * @class Session
 * @brief Process-lifetime holder of at most one active Corpus.
 *
 * Ingestion holds the exclusive lock for its whole build sequence and
 * publishes the new corpus with a single pointer swap. Readers take the shared
 * lock only while they look at the corpus. The state can be read without any
 * lock.
 *
 * State transitions:
 *   Empty -> Ingesting -> Ready   (publish)
 *   Empty -> Ingesting -> Empty   (abandon_ingestion)
 *   Ready -> Ingesting -> Ready   (publish, or abandon_ingestion keeping the old corpus)
 */
class Session {
 public:
  Session() = default;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  SessionState state() const {
    return state_.load();
  }

  std::shared_lock<std::shared_mutex> acquire_shared() const {
    return std::shared_lock<std::shared_mutex>(mutex_);
  }
  std::unique_lock<std::shared_mutex> acquire_exclusive() {
    return std::unique_lock<std::shared_mutex>(mutex_);
  }

  // The following require the caller to hold the exclusive lock
  void begin_ingestion();
  void publish(std::shared_ptr<const Corpus> corpus);
  void abandon_ingestion();

  // Requires the caller to hold either lock
  const std::shared_ptr<const Corpus> &active_corpus() const {
    return corpus_;
  }

  // Takes the shared lock itself; must not be called while holding a lock
  std::shared_ptr<const Corpus> corpus() const;

 private:
  mutable std::shared_mutex mutex_;
  std::atomic<SessionState> state_{SessionState::Empty};
  std::shared_ptr<const Corpus> corpus_;
};

}  // namespace docqa_core
