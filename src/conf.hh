// sbsim scoreboard simulator
//
// general configuration
//

#ifndef SBSIM_CONF_H
#define SBSIM_CONF_H

#include "types.hh"

#include "core/cconf.hh"
#include "frontend/fconf.hh"


// simulator config
#define MAX_CYCLES      UINT64_MAX          // max cycles before halt, debug use
#define UQUEUE_SIZE     16                  // number of uops in the uQueue
#define SILENT_HALT     1                   // stop fetching without exception after the last uop

// program image
#define CODE_START      0x0000              // address of the first uop
#define UOP_BYTES       16                  // bytes per uop in the image


// logging
#define LOG_SIM_INIT    1                   // log parameters
#define LOG_STATE_PRE   3                   // log state before cycle
#define LOG_STATE_POST  3                   // log state after cycle

static_assert((UOP_BYTES == sizeof(uop)),   "Image format must match uop layout.");

#define BANNER_STRING   "//           __         _          \n//   _____ / /_  _____(_)___ ___  \n\
//  / ___// __ \\/ ___/ / __ `__ \\ \n// (__  )/ /_/ (__  ) / / / / / / \n\
// /____//_.___/____/_/_/ /_/ /_/  \n//                \n"

#endif // SBSIM_CONF_H
