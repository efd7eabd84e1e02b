#pragma once

#include "pulse/automation/v1/graph.pb.h"
#include "pulse/automation/v1/execution.pb.h"
#include "pulse/automation/v1/automation_service.pb.h"
#include "pulse/automation/v1/automation_service.grpc.pb.h"
