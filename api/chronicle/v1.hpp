#pragma once

#include "chronicle/bank/v1/account_events.pb.h"
#include "chronicle/catalog/v1/documents.pb.h"

namespace chronicle::v1 {
using namespace ::chronicle::bank::v1;
using namespace ::chronicle::catalog::v1;
}
