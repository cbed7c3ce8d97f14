#pragma once

#include "settle/v1/types.pb.h"

#include "settle/v1/settlement_service.pb.h"
#include "settle/v1/settlement_service.grpc.pb.h"
