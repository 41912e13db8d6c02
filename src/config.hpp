#pragma once

/*here you can tune the form defaults*/

#define TF_LOG_FILE_ENV  "TTYFORM_LOG"
#define TF_LOG_LEVEL_ENV "TTYFORM_LOG_LEVEL"

#ifndef TF_DEFAULT_LOG_LEVEL
#define TF_DEFAULT_LOG_LEVEL "info"
#endif

/* 0: wrap at the terminal width */
#ifndef TF_MAX_WIDTH
#define TF_MAX_WIDTH 0
#endif

#define TF_COLOR_ACCENT  1
#define TF_COLOR_DEFAULT 2
#define TF_COLOR_MUTED   3
#define TF_COLOR_ERROR   4
#define TF_COLOR_SELECTED 5
