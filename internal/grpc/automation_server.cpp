#include "automation_server.hpp"

#include "grpc_error.hpp"
#include "internal/execution/progress_sink.hpp"
#include "pulse/automation/v1.hpp"

namespace pulse::grpc {

namespace {

// Progress events onto the response stream. Once a write fails the client
// is gone and every later event is refused.
class WriterSink final : public pulse::execution::ProgressSink {
public:
  WriterSink(::grpc::ServerContext* ctx, ::grpc::ServerWriter<pulse::automation::v1::ProgressEvent>* writer)
      : ctx_(ctx), writer_(writer) {}

  bool Publish(const pulse::automation::v1::ProgressEvent& event) override {
    if (ctx_->IsCancelled()) {
      return false;
    }
    return writer_->Write(event);
  }

private:
  ::grpc::ServerContext* ctx_;
  ::grpc::ServerWriter<pulse::automation::v1::ProgressEvent>* writer_;
};

} // namespace

AutomationServer::AutomationServer(std::shared_ptr<pulse::service::AutomationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AutomationServer::CreateAutomation(::grpc::ServerContext*,
                                                  const pulse::automation::v1::CreateAutomationRequest* req,
                                                  pulse::automation::v1::Automation* resp) {
  try {
    *resp = service_->CreateAutomation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::GetAutomation(::grpc::ServerContext*,
                                               const pulse::automation::v1::GetAutomationRequest* req,
                                               pulse::automation::v1::Automation* resp) {
  try {
    *resp = service_->GetAutomation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::DeleteAutomation(::grpc::ServerContext*,
                                                  const pulse::automation::v1::DeleteAutomationRequest* req,
                                                  google::protobuf::Empty*) {
  try {
    service_->DeleteAutomation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::AppendNode(::grpc::ServerContext*,
                                            const pulse::automation::v1::AppendNodeRequest* req,
                                            pulse::automation::v1::AppendNodeResponse* resp) {
  try {
    *resp = service_->AppendNode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::UpdateNodeParams(::grpc::ServerContext*,
                                                  const pulse::automation::v1::UpdateNodeParamsRequest* req,
                                                  pulse::automation::v1::Automation* resp) {
  try {
    *resp = service_->UpdateNodeParams(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::RemoveNode(::grpc::ServerContext*,
                                            const pulse::automation::v1::RemoveNodeRequest* req,
                                            pulse::automation::v1::RemoveNodeResponse* resp) {
  try {
    *resp = service_->RemoveNode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::ResetAutomation(::grpc::ServerContext*,
                                                 const pulse::automation::v1::ResetAutomationRequest* req,
                                                 pulse::automation::v1::Automation* resp) {
  try {
    *resp = service_->ResetAutomation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

// Node failures end the stream normally (DONE with success=false); only
// problems that prevent the run from starting become a non-OK status.
::grpc::Status AutomationServer::RunAutomation(::grpc::ServerContext* ctx,
                                               const pulse::automation::v1::RunAutomationRequest* req,
                                               ::grpc::ServerWriter<pulse::automation::v1::ProgressEvent>* writer) {
  try {
    WriterSink sink(ctx, writer);
    service_->RunAutomation(*req, sink);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::StopExecution(::grpc::ServerContext*,
                                               const pulse::automation::v1::StopExecutionRequest* req,
                                               pulse::automation::v1::StopExecutionResponse* resp) {
  try {
    *resp = service_->StopExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::ClearStaleExecutions(::grpc::ServerContext*,
                                                      const pulse::automation::v1::ClearStaleExecutionsRequest* req,
                                                      pulse::automation::v1::ClearStaleExecutionsResponse* resp) {
  try {
    *resp = service_->ClearStaleExecutions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::GetExecution(::grpc::ServerContext*,
                                              const pulse::automation::v1::GetExecutionRequest* req,
                                              pulse::automation::v1::Execution* resp) {
  try {
    *resp = service_->GetExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::ListExecutions(::grpc::ServerContext*,
                                                const pulse::automation::v1::ListExecutionsRequest* req,
                                                pulse::automation::v1::ListExecutionsResponse* resp) {
  try {
    *resp = service_->ListExecutions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AutomationServer::GetNodeStatuses(::grpc::ServerContext*,
                                                 const pulse::automation::v1::GetNodeStatusesRequest* req,
                                                 pulse::automation::v1::GetNodeStatusesResponse* resp) {
  try {
    *resp = service_->GetNodeStatuses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace pulse::grpc
