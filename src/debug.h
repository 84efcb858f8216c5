
#ifndef INCLUDE_SEMCHART_DEBUG_H_
#define INCLUDE_SEMCHART_DEBUG_H_

#include <stdexcept>

// accessor that the concrete class does not support
#define NO_IMPLEMENTATION { throw std::logic_error(__PRETTY_FUNCTION__); }

#endif
