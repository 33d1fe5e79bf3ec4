#pragma once

#include "tablebook/core/v1/types.pb.h"
#include "tablebook/core/v1/catalog.pb.h"

#include "tablebook/booking/v1/availability.pb.h"
#include "tablebook/booking/v1/booking.pb.h"

#include "tablebook/admin/v1/locks.pb.h"

namespace tablebook::v1 {
using namespace ::tablebook::core::v1;
using namespace ::tablebook::booking::v1;
using namespace ::tablebook::admin::v1;
}
