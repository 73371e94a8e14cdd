/// @file state.hpp
/// @brief Main include for the keystone_state module

#pragma once

#include "fwd.hpp"
#include "value.hpp"
#include "path.hpp"
#include "query.hpp"
#include "mutation.hpp"
#include "diff.hpp"
#include "transaction.hpp"
#include "observer.hpp"
#include "config.hpp"
#include "store.hpp"
#include "random.hpp"
