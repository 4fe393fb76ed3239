#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/block/block_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lineage/lineage_manager.hpp"
#include "internal/model/file_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl <config.yaml> datasets\n"
            << "  ledgerctl <config.yaml> files <dataset> [max_files]\n"
            << "  ledgerctl <config.yaml> algos <dataset>\n"
            << "  ledgerctl <config.yaml> mark-uploaded <id>...\n"
            << "  ledgerctl <config.yaml> count\n"
            << "  ledgerctl <config.yaml> parents <lfn>\n"
            << "  ledgerctl <config.yaml> children <lfn>\n"
            << "  ledgerctl <config.yaml> block <lfn>\n"
            << "  ledgerctl <config.yaml> block-status <block> <OPEN|PENDING|CLOSED> [site]...\n";
}

static std::optional<uint64_t> ParseId(const std::string& value) {
  // stoull accepts a sign and wraps negatives around
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) return std::nullopt;
  try {
    std::size_t pos = 0;
    auto        id  = std::stoull(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return id;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

static void PrintLines(const std::vector<std::string>& lines) {
  for (const auto& line : lines) std::cout << line << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = ledger::config::ConfigLoader::LoadFromYaml(config_path);
    ledger::observability::InitializeLogging(config);

    auto  app     = ledger::factory::Build(config);
    auto& repo    = *app.repository;
    auto& service = *app.upload_service;

    // ------------------------------------------------------------

    if (cmd == "datasets") {
      PrintLines(service.FindUploadableDatasets());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "files") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      std::vector<ledger::upload::FileSummary> files;
      if (argc >= 5) {
        auto max_files = ParseId(argv[4]);
        if (!max_files) {
          std::cerr << "invalid max_files: " << argv[4] << "\n";
          return 1;
        }
        files = service.FindUploadableFiles(argv[3], *max_files);
      } else {
        files = service.FindUploadableFiles(argv[3]);
      }

      for (const auto& f : files) {
        std::cout << "id=" << f.id << " lfn=" << f.lfn << " size=" << f.size_bytes << " events=" << f.events;
        if (!f.block.empty()) std::cout << " block=" << f.block;
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "algos") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      for (const auto& a : service.FindAlgos(argv[3])) {
        std::cout << a.app_name << " " << a.app_version << " " << a.app_family << " " << a.pset_hash << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "mark-uploaded") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      std::vector<uint64_t> ids;
      for (int i = 3; i < argc; ++i) {
        auto id = ParseId(argv[i]);
        if (!id) {
          std::cerr << "invalid file id: " << argv[i] << "\n";
          return 1;
        }
        ids.push_back(*id);
      }

      service.UpdateFilesStatus(ids);
      std::cout << "updated=" << ids.size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "count") {
      std::cout << "files=" << service.CountFiles() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "parents" || cmd == "children") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto                    tx = repo.Begin();
      ledger::lineage::LineageManager lineage(repo);
      auto lfns = cmd == "parents" ? lineage.GetParents(*tx, argv[3]) : lineage.GetChildren(*tx, argv[3]);
      tx->Commit();

      PrintLines(lfns);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "block") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto tx    = repo.Begin();
      auto block = ledger::block::BlockManager(repo).GetBlock(*tx, argv[3]);
      tx->Commit();

      std::cout << (block ? *block : std::string("<none>")) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "block-status") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto status = ledger::model::ParseBlockStatus(argv[4]);
      if (!status) {
        std::cerr << "unsupported block status: " << argv[4] << "\n";
        return 1;
      }

      ledger::model::SiteSet sites;
      for (int i = 5; i < argc; ++i) sites.insert(argv[i]);

      auto tx = repo.Begin();
      ledger::block::BlockManager(repo).SetBlockStatus(*tx, argv[3], sites, *status);
      tx->Commit();

      std::cout << "block=" << argv[3] << " status=" << ledger::model::ToString(*status) << "\n";
      return 0;
    }
  } catch (const ledger::util::NotFoundError& e) {
    std::cerr << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("ledgerctl failed", {ledger::observability::StringField("command", cmd),
                                          ledger::observability::StringField("error", e.what())});
    return 2;
  }

  Usage();
  return 1;
}
