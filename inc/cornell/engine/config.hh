#pragma once

#ifndef CORNELL_DEBUG
# ifdef NDEBUG
#  define CORNELL_DEBUG 0
# else
#  define CORNELL_DEBUG 1
# endif
#endif

#ifndef CORNELL_RESOURCE_DIR
# define CORNELL_RESOURCE_DIR "res"
#endif
