#pragma once

#include "dispatcher/v1/dispatch_service.pb.h"
#include "dispatcher/v1/process.pb.h"
#include "dispatcher/v1/registry_service.pb.h"
