#include "internal/location/location_manager.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::location {

LocationManager::LocationManager(db::Repository& repo) : repo_(repo) {
}

void LocationManager::Persist(db::Transaction& tx, uint64_t file_id, const ledger::model::SiteSet& sites) {
  for (const auto& site : sites) {
    ledger::util::ThrowIfDbError(repo_.AddFileLocation(tx, file_id, site), "add location " + site);
  }
}

ledger::model::SiteSet LocationManager::List(db::Transaction& tx, uint64_t file_id) {
  return repo_.GetLocations(tx, file_id);
}

void LocationManager::EnsureSites(db::Transaction& tx, const ledger::model::SiteSet& sites) {
  for (const auto& site : sites) {
    ledger::util::ThrowIfDbError(repo_.AddLocation(tx, site), "add site " + site);
  }
}

// ---------------------------------------------------------------------
// SiteBuffer
// ---------------------------------------------------------------------

SiteBuffer::SiteBuffer() : state_(std::make_shared<State>()) {
}

SiteBuffer::SiteBuffer(const SiteBuffer& other) : state_(std::make_shared<State>(other.state())) {
}

SiteBuffer& SiteBuffer::operator=(const SiteBuffer& other) {
  if (this != &other) {
    state_ = std::make_shared<State>(other.state());
  }
  return *this;
}

const SiteBuffer::State& SiteBuffer::state() const {
  // moved-from buffers read as empty
  static const State kEmpty;
  return state_ ? *state_ : kEmpty;
}

SiteBuffer::State& SiteBuffer::state() {
  if (!state_) {
    state_ = std::make_shared<State>();
  }
  return *state_;
}

std::shared_ptr<SiteBuffer::State> SiteBuffer::Share() {
  state();
  return state_;
}

// ---------------------------------------------------------------------
// PendingLocations
// ---------------------------------------------------------------------

PendingLocations::PendingLocations(std::shared_ptr<SiteBuffer::State> state, std::string lfn,
                                   std::optional<uint64_t> file_id, ledger::model::SiteSet sites)
    : state_(std::move(state)), lfn_(std::move(lfn)), file_id_(file_id), sites_(std::move(sites)) {
}

PendingLocations::PendingLocations(PendingLocations&& other) noexcept
    : state_(std::move(other.state_)),
      lfn_(std::move(other.lfn_)),
      file_id_(other.file_id_),
      sites_(std::move(other.sites_)) {
}

PendingLocations& PendingLocations::operator=(PendingLocations&& other) noexcept {
  if (this != &other) {
    WarnIfUnsettled();
    state_   = std::move(other.state_);
    lfn_     = std::move(other.lfn_);
    file_id_ = other.file_id_;
    sites_   = std::move(other.sites_);
  }
  return *this;
}

PendingLocations::~PendingLocations() {
  WarnIfUnsettled();
}

void PendingLocations::Flush(db::Repository& repo, db::Transaction& tx) {
  if (!state_) {
    return;
  }
  if (!state_->pending.empty()) {
    std::optional<db::model::FileRow> row;
    if (!lfn_.empty()) {
      row = repo.GetFileByLfn(tx, lfn_);
    } else if (file_id_) {
      row = repo.GetFileById(tx, *file_id_);
    }
    if (!row) {
      throw ledger::util::NotFoundError("flush locations: no file " + Describe());
    }
    LocationManager(repo).Persist(tx, row->id, state_->pending);
    state_->pending.clear();
  }
  state_.reset();
}

void PendingLocations::Discard() {
  if (!state_) {
    return;
  }
  for (const auto& site : sites_) {
    // already written sites stay known
    if (state_->pending.erase(site) > 0) {
      state_->known.erase(site);
    }
  }
  state_.reset();
}

std::string PendingLocations::Describe() const {
  if (!lfn_.empty()) {
    return lfn_;
  }
  return file_id_ ? "id " + std::to_string(*file_id_) : std::string("unnamed record");
}

void PendingLocations::WarnIfUnsettled() const {
  if (!state_ || sites_.empty()) {
    return;
  }
  LEDGER_LOG_WARN("Deferred locations neither flushed nor discarded; they stay buffered on the record",
                  {ledger::observability::StringField("lfn", Describe()),
                   ledger::observability::IntField("sites", static_cast<std::int64_t>(sites_.size()))});
}

} // namespace ledger::location
