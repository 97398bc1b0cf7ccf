#pragma once

#ifdef __cplusplus
extern "C" {
#endif

enum CSH_OBJECT_TYPE {
  CSH_OTYPE_CUE,
  CSH_OTYPE_SCHEDULER,
  CSH_OTYPE_SUBSCRIPTION,
};

enum CSH_CUE_KIND {
  CSH_CUE_KIND_ONE_SHOT,
  CSH_CUE_KIND_REPEATING,
  CSH_CUE_KIND_TERMINATED,
};

#ifdef __cplusplus
}
#endif
