#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ledger::model {

enum class FileStatus : std::uint8_t {
  kNotUploaded = 0,
  kUploaded = 1,
  // Known to the catalog already; produced outside this ledger.
  kAlreadyInCatalog = 2,
};

enum class BlockStatus : std::uint8_t {
  kOpen = 0,
  kPending = 1,
  kClosed = 2,
};

constexpr std::string_view ToString(FileStatus status) {
  switch (status) {
    case FileStatus::kUploaded:
      return "UPLOADED";
    case FileStatus::kAlreadyInCatalog:
      return "ALREADY_IN_CATALOG";
    case FileStatus::kNotUploaded:
    default:
      return "NOTUPLOADED";
  }
}

constexpr std::string_view ToString(BlockStatus status) {
  switch (status) {
    case BlockStatus::kPending:
      return "PENDING";
    case BlockStatus::kClosed:
      return "CLOSED";
    case BlockStatus::kOpen:
    default:
      return "OPEN";
  }
}

constexpr std::optional<FileStatus> ParseFileStatus(std::string_view text) {
  if (text == "NOTUPLOADED") return FileStatus::kNotUploaded;
  if (text == "UPLOADED") return FileStatus::kUploaded;
  if (text == "ALREADY_IN_CATALOG") return FileStatus::kAlreadyInCatalog;
  return std::nullopt;
}

constexpr std::optional<BlockStatus> ParseBlockStatus(std::string_view text) {
  if (text == "OPEN") return BlockStatus::kOpen;
  if (text == "PENDING") return BlockStatus::kPending;
  if (text == "CLOSED") return BlockStatus::kClosed;
  return std::nullopt;
}

// A parent in one of these states no longer holds back its children.
constexpr bool IsInCatalog(FileStatus status) {
  return status == FileStatus::kUploaded || status == FileStatus::kAlreadyInCatalog;
}

}  // namespace ledger::model
