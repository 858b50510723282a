#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace blockforge::db { class Repository; }
namespace blockforge::core { class BlockManager; }
namespace blockforge::service { class BlockService; }

namespace blockforge::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<core::BlockManager>            manager;
  std::shared_ptr<service::BlockService>         block_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config. This is the
  composition root and the only place that knows concrete backend types.
*/
Application Build(const blockforge::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const blockforge::runtime::config::RuntimeConfig& config);

} // namespace blockforge::factory
