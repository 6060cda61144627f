#include "Logging.h"

bool g_verbose = false;
