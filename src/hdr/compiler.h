// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_HDR_COMPILER_H
#define __SRC_HDR_COMPILER_H

#define __PRINTF__(a,b) __attribute__((format(printf,a,b)))
#define __NORETURN__    __attribute__((noreturn))

#endif /* __SRC_HDR_COMPILER_H */
