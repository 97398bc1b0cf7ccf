/**
 * Helpers for all examples.
 * */
#include "cuesheet.h"

#include <stdio.h>
#include <stdlib.h>

#define CHECKED(x)                                                                                                     \
  do {                                                                                                                 \
    int ret = x;                                                                                                       \
    if (ret) {                                                                                                         \
      printf(#x ": cuesheet error code %i message %s\n", ret, csh_getLastErrorMessage());                              \
      csh_shutdown();                                                                                                  \
      exit(EXIT_FAILURE);                                                                                              \
    }                                                                                                                  \
  } while (0)
