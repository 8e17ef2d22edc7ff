#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(ItemId)
DEFINE_ID_TYPE(FileId)
DEFINE_ID_TYPE(SessionId)
DEFINE_ID_TYPE(BatchId)
DEFINE_ID_TYPE(WorkerId)
