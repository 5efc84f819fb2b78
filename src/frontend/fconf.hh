// sbsim scoreboard simulator
//
// frontend config
//

#ifndef SBSIM_FCONF_H
#define SBSIM_FCONF_H

#define FETCH_WIDTH     2                   // uops fetched each cycle
#define FETCH_LATENCY   1                   // fetch + bp latency

// branch prediction
#define BTB_SIZE        64


// logging
#define LOG_FE_INIT     1
#define LOG_FE_FETCH    5

#define LOG_BP_ALL      3

#endif // SBSIM_FCONF_H
