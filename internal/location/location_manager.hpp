#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/location.hpp"

namespace ledger::core {
class FileRecord;
}

namespace ledger::location {

/*
  Replica-set persistence. Every write is idempotent: a site already
  mapped to the file is left alone.
*/
class LocationManager {
 public:
  explicit LocationManager(db::Repository& repo);

  void Persist(db::Transaction& tx, uint64_t file_id, const ledger::model::SiteSet& sites);

  ledger::model::SiteSet List(db::Transaction& tx, uint64_t file_id);

  // Registers site names that no file references yet.
  void EnsureSites(db::Transaction& tx, const ledger::model::SiteSet& sites);

 private:
  db::Repository& repo_;
};

/*
  Location state of one FileRecord: every known site and the subset not
  written yet.

  Copies are deep. Moves hand the same state over, so a PendingLocations
  issued before the record moved still reaches the live record.
*/
class SiteBuffer {
 public:
  struct State {
    // every known site, buffered ones included
    ledger::model::SiteSet known;
    // sites not written yet
    ledger::model::SiteSet pending;
  };

  SiteBuffer();
  SiteBuffer(const SiteBuffer& other);
  SiteBuffer& operator=(const SiteBuffer& other);
  SiteBuffer(SiteBuffer&&) noexcept            = default;
  SiteBuffer& operator=(SiteBuffer&&) noexcept = default;

  const State& state() const;
  State&       state();

  std::shared_ptr<State> Share();

  // True while a PendingLocations still holds this state.
  bool HasOpenHandles() const {
    return state_ && state_.use_count() > 1;
  }

 private:
  std::shared_ptr<State> state_;
};

/*
  Sites buffered on a FileRecord by DeferLocation().

  The caller decides their fate: Flush() writes every buffered site of
  the record, Discard() takes back the sites this handle added. A handle
  dropped without either logs a warning and leaves its sites buffered on
  the record until the next immediate SetLocation() or Create().

  The handle shares the record's buffer and names the file by LFN (or
  id), so it stays valid when the record is moved, copied or destroyed.
  Flush() throws util::NotFoundError when the file is not stored.
*/
class [[nodiscard]] PendingLocations {
 public:
  PendingLocations(PendingLocations&& other) noexcept;
  PendingLocations& operator=(PendingLocations&& other) noexcept;
  PendingLocations(const PendingLocations&)            = delete;
  PendingLocations& operator=(const PendingLocations&) = delete;
  ~PendingLocations();

  void Flush(db::Repository& repo, db::Transaction& tx);
  void Discard();

  // Sites this handle added to the buffer.
  const ledger::model::SiteSet& sites() const {
    return sites_;
  }

  bool settled() const {
    return state_ == nullptr;
  }

 private:
  friend class ledger::core::FileRecord;

  PendingLocations(std::shared_ptr<SiteBuffer::State> state, std::string lfn, std::optional<uint64_t> file_id,
                   ledger::model::SiteSet sites);

  std::string Describe() const;
  void        WarnIfUnsettled() const;

  std::shared_ptr<SiteBuffer::State> state_;
  std::string                        lfn_;
  std::optional<uint64_t>            file_id_;
  ledger::model::SiteSet             sites_;
};

} // namespace ledger::location
