#pragma once

#include "pulse/automation/v1/execution.pb.h"

namespace pulse::execution {

// Destination of run progress events (a gRPC stream, a test buffer).
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  // Returns false once the consumer is gone. The run keeps going regardless.
  virtual bool Publish(const pulse::automation::v1::ProgressEvent& event) = 0;
};

} // namespace pulse::execution
