#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/upload_service.hpp"

namespace ledger::factory {

/*
  Application

  Long-lived objects of one ledger process.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<service::UploadService> upload_service;
};

/*
  BuildRepository

  Opens the configured backend and brings its schema up to date.
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: repository plus the services on top of it.
*/
Application Build(const ledger::runtime::config::RuntimeConfig& config);

} // namespace ledger::factory
