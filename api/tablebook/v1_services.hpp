#pragma once

#include "tablebook/v1.hpp"

#include "tablebook/services/v1/availability_service.grpc.pb.h"
#include "tablebook/services/v1/booking_service.grpc.pb.h"
#include "tablebook/services/v1/admin_service.grpc.pb.h"

namespace tablebook::v1 {
using namespace ::tablebook::services::v1;
}
