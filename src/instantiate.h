
#ifndef INCLUDE_SEMCHART_INSTANTIATE_H_
#define INCLUDE_SEMCHART_INSTANTIATE_H_

#include "feat.h"

namespace semchart {

// next value of the process-wide counter behind every fresh name.
// safe to call from several OpenMP threads.
unsigned NextFreshId();

// replace each @x placeholder in `fs` with a logic variable x<N> that no
// other instantiation has produced. every occurrence of one placeholder maps
// to the same variable. throws CaptureHazard when a minted name is already
// used in `fs`.
FeatType InstantiatePlaceholders(FeatType fs);

// names of the placeholders still present in `value`
std::vector<std::string> Placeholders(Value value);

} // namespace semchart

#endif
