
#ifndef INCLUDE_SEMCHART_ERRORS_H_
#define INCLUDE_SEMCHART_ERRORS_H_

#include <string>
#include <stdexcept>

namespace semchart {

// raised while loading a grammar; nothing is parsed with it
class MalformedGrammar: public std::runtime_error
{
public:
    explicit MalformedGrammar(const std::string& message)
        : std::runtime_error("malformed grammar: " + message), detail_(message) {}

    MalformedGrammar(const std::string& message, unsigned line)
        : std::runtime_error("malformed grammar (line "
                + std::to_string(line) + "): " + message), detail_(message) {}

    // the message without the location prefix
    const std::string& Detail() const { return detail_; }

private:
    std::string detail_;
};

// beta reduction ran past its step bound
class NonTerminatingReduction: public std::runtime_error
{
public:
    NonTerminatingReduction(const std::string& term, unsigned steps)
        : std::runtime_error("reduction did not terminate after "
                + std::to_string(steps) + " steps: " + term) {}
};

// a placeholder survived instantiation or a fresh name collided.
// never caused by input; always an engine bug.
class CaptureHazard: public std::logic_error
{
public:
    explicit CaptureHazard(const std::string& message)
        : std::logic_error("variable capture hazard: " + message) {}
};

class ChartOverflow: public std::runtime_error
{
public:
    explicit ChartOverflow(unsigned max_edges)
        : std::runtime_error("chart exceeded " +
                std::to_string(max_edges) + " edges") {}
};

} // namespace semchart

#endif
