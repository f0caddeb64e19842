#pragma once

// Message types shared by the service layer and the gRPC adapters.
#include "freight/exchange/v1/types.pb.h"

#include "freight/exchange/v1/driver_service.pb.h"
#include "freight/exchange/v1/shipper_service.pb.h"
