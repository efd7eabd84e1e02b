#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/automation_service.hpp"
#include "pulse/automation/v1/automation_service.grpc.pb.h"
#include "pulse/automation/v1.hpp"

namespace pulse::grpc {

class AutomationServer final : public pulse::automation::v1::AutomationService::Service {
public:
  explicit AutomationServer(std::shared_ptr<pulse::service::AutomationService> svc);

  ::grpc::Status CreateAutomation(::grpc::ServerContext*,
                                  const pulse::automation::v1::CreateAutomationRequest*,
                                  pulse::automation::v1::Automation*) override;

  ::grpc::Status GetAutomation(::grpc::ServerContext*,
                               const pulse::automation::v1::GetAutomationRequest*,
                               pulse::automation::v1::Automation*) override;

  ::grpc::Status DeleteAutomation(::grpc::ServerContext*,
                                  const pulse::automation::v1::DeleteAutomationRequest*,
                                  google::protobuf::Empty*) override;

  ::grpc::Status AppendNode(::grpc::ServerContext*,
                            const pulse::automation::v1::AppendNodeRequest*,
                            pulse::automation::v1::AppendNodeResponse*) override;

  ::grpc::Status UpdateNodeParams(::grpc::ServerContext*,
                                  const pulse::automation::v1::UpdateNodeParamsRequest*,
                                  pulse::automation::v1::Automation*) override;

  ::grpc::Status RemoveNode(::grpc::ServerContext*,
                            const pulse::automation::v1::RemoveNodeRequest*,
                            pulse::automation::v1::RemoveNodeResponse*) override;

  ::grpc::Status ResetAutomation(::grpc::ServerContext*,
                                 const pulse::automation::v1::ResetAutomationRequest*,
                                 pulse::automation::v1::Automation*) override;

  ::grpc::Status RunAutomation(::grpc::ServerContext*,
                               const pulse::automation::v1::RunAutomationRequest*,
                               ::grpc::ServerWriter<pulse::automation::v1::ProgressEvent>*) override;

  ::grpc::Status StopExecution(::grpc::ServerContext*,
                               const pulse::automation::v1::StopExecutionRequest*,
                               pulse::automation::v1::StopExecutionResponse*) override;

  ::grpc::Status ClearStaleExecutions(::grpc::ServerContext*,
                                      const pulse::automation::v1::ClearStaleExecutionsRequest*,
                                      pulse::automation::v1::ClearStaleExecutionsResponse*) override;

  ::grpc::Status GetExecution(::grpc::ServerContext*,
                              const pulse::automation::v1::GetExecutionRequest*,
                              pulse::automation::v1::Execution*) override;

  ::grpc::Status ListExecutions(::grpc::ServerContext*,
                                const pulse::automation::v1::ListExecutionsRequest*,
                                pulse::automation::v1::ListExecutionsResponse*) override;

  ::grpc::Status GetNodeStatuses(::grpc::ServerContext*,
                                 const pulse::automation::v1::GetNodeStatusesRequest*,
                                 pulse::automation::v1::GetNodeStatusesResponse*) override;

private:
  std::shared_ptr<pulse::service::AutomationService> service_;
};

} // namespace pulse::grpc
