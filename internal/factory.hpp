#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace pulse::db { class Repository; }
namespace pulse::status { class StatusRegistry; }
namespace pulse::service { class AutomationService; }

namespace pulse::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<pulse::db::Repository> repository;
  std::shared_ptr<pulse::status::StatusRegistry> statuses;
  std::shared_ptr<pulse::service::AutomationService> automation_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const pulse::runtime::config::RuntimeConfig& config);

} // namespace pulse::factory
