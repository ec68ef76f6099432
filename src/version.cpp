#include "runerip/version.h"

#ifndef RUNERIP_VERSION
#define RUNERIP_VERSION "0.0.0"
#endif

const char* runerip::version_string()
{
    return RUNERIP_VERSION;
}
