#ifndef _PHASH_TRACELOG_
#define _PHASH_TRACELOG_

#include <plog/Log.h>

namespace tracelog
{
    int init();

} // namespace tracelog

#endif
