#pragma once

/*compile-time settings, override any of them with -D at build time*/

#ifndef MT_CATALOG_PATH
#define MT_CATALOG_PATH "foods"
#endif

#ifndef MT_LOG_PATH
#define MT_LOG_PATH "macrotrack.log"
#endif

#define MT_LOG_DEBUG 0
#define MT_LOG_INFO  1
#define MT_LOG_WARN  2
#define MT_LOG_ERROR 3

#ifndef MT_LOG_LEVEL
#define MT_LOG_LEVEL MT_LOG_INFO
#endif

#ifndef MT_ESC_DELAY_MS
#define MT_ESC_DELAY_MS 25
#endif

/*screen layout*/
#define MT_HELP_HEIGHT 3   // rows below the border reserved for the help bar
#define MT_HELP_PAD    5   // blank columns between help labels
#define MT_LABEL_WIDTH 10  // widest form label
#define MT_INPUT_WIDTH 50  // columns from a form box's left border to its right border
#define MT_FIELD_ROWS  3   // rows taken by one label + box
