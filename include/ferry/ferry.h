#pragma once

/// @file ferry.h
/// Umbrella header: include this to get the full ferry C++ API.

#include "error.h"
#include "types.h"
#include "log.h"
#include "filter.h"
#include "digest.h"
#include "resolver.h"
#include "executor.h"
#include "journal.h"
#include "replay.h"
#include "engine.h"
