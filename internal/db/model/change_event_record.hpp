#pragma once

#include "internal/model/change_event.hpp"

namespace storykb::db::model {

/*
  Ledger rows are stored exactly as the domain event; the sequence column
  is the append order.
*/

using ChangeEventRecord = storykb::model::ChangeEvent;
using ChangeStatus      = storykb::model::ChangeStatus;
using ChangeType        = storykb::model::ChangeType;

} // namespace storykb::db::model
