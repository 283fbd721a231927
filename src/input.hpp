#pragma once
/*
 * Input
 *
 * Purpose: map one wget_wch() result to an Event, with no terminal state involved.
 * rc: OK for a character, KEY_CODE_YES for a function key (ERR is the caller's).
 * Note: Resize events come back with zero size; the backend fills in the screen size.
 */
#include <cwchar>
#include "types.hpp"

Event translate_input(int rc, wint_t wch);
