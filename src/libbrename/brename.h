// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_BRENAME_H
#define __SRC_LIBBRENAME_BRENAME_H

#define BRENAME_VERSION         0x100
#define BRENAME_VERSION_STR     "1.0.0"

#include "exception.h"
#include "debug.h"
#include "mapping.h"
#include "config.h"
#include "validate.h"
#include "resolve.h"
#include "state.h"
#include "rename_queue.h"
#include "walk_dir.h"

#endif /* __SRC_LIBBRENAME_BRENAME_H */
