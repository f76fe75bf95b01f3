#pragma once

#include "settleup/ledger/v1/balance.pb.h"
#include "settleup/ledger/v1/expense.pb.h"
