#ifndef TICKBOOK_TICKBOOK_HPP
#define TICKBOOK_TICKBOOK_HPP

// Umbrella header for the tickbook library

#include "types.hpp"
#include "full_math.hpp"
#include "tick_math.hpp"
#include "journal.hpp"
#include "token.hpp"
#include "order_id.hpp"
#include "claims.hpp"
#include "pool.hpp"
#include "settlement.hpp"
#include "order_ledger.hpp"
#include "hook.hpp"
#include "router.hpp"
#include "config.hpp"

#endif // TICKBOOK_TICKBOOK_HPP
