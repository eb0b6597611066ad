#pragma once

/*build-time defaults; MNANO_VERSION is normally passed in by the build*/

#define MNANO_NAME "mnano"

#ifndef MNANO_VERSION
#define MNANO_VERSION "0.1.0"
#endif

#define MNANO_RC_FILE ".mnanorc"
#define MNANO_RC_ENV  "MNANO_RC"

/*chunk size used when streaming a buffer to disk*/
#ifndef MNANO_WRITE_CHUNK_SIZE
#define MNANO_WRITE_CHUNK_SIZE (64 * 1024)
#endif

/*rows used by the title bar, the status row and the shortcut bar*/
#define MNANO_TITLE_ROWS   1
#define MNANO_STATUS_ROWS  1
#define MNANO_HELPBAR_ROWS 1

/*milliseconds ncurses waits after ESC before reporting a bare Escape key*/
#define MNANO_ESC_DELAY_MS 25
