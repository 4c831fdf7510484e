#ifndef FJS_DEBUG_H
#define FJS_DEBUG_H

#include <iostream>

// Debug output macro for the FJS analyzer
// Define FJS_DEBUG to enable debug output, otherwise it's a no-op
#ifdef FJS_DEBUG
#define DEBUG_OUT(x) std::cerr << x
#else
#define DEBUG_OUT(x)
#endif

#endif // FJS_DEBUG_H
