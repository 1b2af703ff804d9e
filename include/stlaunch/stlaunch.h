#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

typedef enum {
	STLAUNCH_SUCCESS,
	STLAUNCH_WARNED,
	STLAUNCH_FAILED,
	STLAUNCH_ERROR,
} stlaunch_outcome_e;

// Loads a TOML run configuration and runs the test runner it describes.
// STLAUNCH_ERROR means the configuration was unusable or the runner could not be started.
stlaunch_outcome_e stlaunch_run_file(const char* path, bool ignore_failures);
const char* stlaunch_outcome_name(stlaunch_outcome_e outcome);

#ifdef __cplusplus
}
#endif
