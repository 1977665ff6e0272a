#include "docqa_core/session.hpp"

#include <stdexcept>

namespace docqa_core {

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Empty:
      return "Empty";
    case SessionState::Ingesting:
      return "Ingesting";
    case SessionState::Ready:
      return "Ready";
  }
  return "Empty";
}

void Session::begin_ingestion() {
  state_.store(SessionState::Ingesting);
}

void Session::publish(std::shared_ptr<const Corpus> corpus) {
  if (!corpus || corpus->passage_count() == 0) {
    throw std::invalid_argument("Cannot publish an empty corpus");
  }
  corpus_ = std::move(corpus);
  state_.store(SessionState::Ready);
}

void Session::abandon_ingestion() {
  state_.store(corpus_ ? SessionState::Ready : SessionState::Empty);
}

std::shared_ptr<const Corpus> Session::corpus() const {
  auto lock = acquire_shared();
  return corpus_;
}

}  // namespace docqa_core
