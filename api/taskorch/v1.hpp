#pragma once

#include "taskorch/v1/types.pb.h"

#include "taskorch/v1/admin_service.pb.h"
#include "taskorch/v1/task_service.pb.h"

#include "taskorch/v1/admin_service.grpc.pb.h"
#include "taskorch/v1/task_service.grpc.pb.h"
