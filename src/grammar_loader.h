
#ifndef INCLUDE_SEMCHART_GRAMMAR_LOADER_H_
#define INCLUDE_SEMCHART_GRAMMAR_LOADER_H_

#include <istream>
#include <string>
#include "grammar.h"

namespace semchart {

// reads a feature grammar in the .fcfg notation:
//
//   % start S
//   S[SEM=[CORE=<?vp(?subj)>, BO={?b1+?b2}]] -> NP[SEM=[CORE=?subj, BO=?b1]] VP[..]
//   Det[SEM=[CORE=<\Q P.exists x.(Q(x) & P(x))>, BO={/}]] -> 'a'
//
// every error is reported as MalformedGrammar with its line number
Grammar LoadGrammar(const std::string& filename);

Grammar ParseGrammar(std::istream& in);

Grammar ParseGrammarString(const std::string& text);

} // namespace semchart

#endif
