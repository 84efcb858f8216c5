
#include "logger.h"

#define BORDER "####################################"

namespace semchart {

ParserLogger::ParserLogger(LogLevel level)
    : level_(level), cur_level_(Info), nprocessed_(0) {}

void ParserLogger::RecordTime(const std::string& name) {
    auto now = std::chrono::system_clock::now();
    times_[name] = now;
}

void ParserLogger::RecordTimeStartRunning() {
    (*this)(Info) << "running chart parser ...";
    RecordTime("time_start_running");
}

void ParserLogger::RecordTimeEndOfParsing() {
    (*this)(Info) << "finished";
    (*this)(Info) << "composing readings ...";
    RecordTime("time_end_of_parsing");
}

void ParserLogger::RecordTimeEndOfComposition() {
    (*this)(Info) << "finished";
    RecordTime("time_end_of_composition");
}

void ParserLogger::RecordEdge(const char* message, const Edge* edge) {
    if (level_ == Debug)
        std::cerr << Red(message) << " [" << edge->GetStart() << ","
                  << edge->GetEnd() << ") " << edge->GetCategory() << std::endl
                  << edge->GetFeatures()->ToStr() << std::endl
                  << Derivation(edge, false)
                  << Cyan(BORDER) << std::endl;
}

void ParserLogger::CompleteOne() {
    int n;
#pragma omp atomic capture
    n = ++nprocessed_;
    if (n % 10 == 0 && level_ <= Info) {
        std::cerr << ".";
        if (n % 500 == 0)
            std::cerr << n << std::endl;
    }
}

double ParserLogger::Seconds(const std::string& from, const std::string& to) {
    if (times_.count(from) == 0 || times_.count(to) == 0)
        return 0.0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(
            times_[to] - times_[from]).count() / 1000.0;
}

void ParserLogger::Report() {
    if (level_ > Info) return;
    double loading_time = Seconds("time_start_loading", "time_end_of_loading");
    double parsing_time = Seconds("time_start_running", "time_end_of_parsing");
    double composition_time = Seconds("time_end_of_parsing", "time_end_of_composition");
    double total = loading_time + parsing_time + composition_time;

    std::cerr << std::endl
              << "grammar loading time: " << loading_time << " seconds" << std::endl
              << "parsing time: " << parsing_time << " seconds" << std::endl
              << "composition time: " << composition_time << " seconds" << std::endl
              << "total elapsed time: " << total << " seconds" << std::endl;
}

} // namespace semchart
