#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(SessionId)
DEFINE_ID_TYPE(TransferId)
