#include "parser.h"
#include "cmdline.h"
#include "grammar_loader.h"
#include "semantics.h"
#include <signal.h>
#include <fstream>
#include <memory>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace semchart;

void sig_handler(int signo) {
    if (signo == SIGTERM || signo == SIGINT)
        ChartParser::keep_going = false;
}

void PrintReadings(const SemanticsComposer& composer, EdgeType parse,
                   bool all, bool unique) {
    std::vector<TermType> readings;
    if (all)
        readings = composer.Readings(parse);
    else
        readings.push_back(composer.Reading(parse));
    if (unique)
        readings = SemanticsComposer::UniqueReadings(readings);
    for (auto&& reading: readings)
        std::cout << reading << std::endl;
}

int main(int argc, char const* argv[])
{

    signal(SIGTERM, sig_handler);
    signal(SIGINT, sig_handler);

    cmdline::parser p;
    p.add<std::string>("grammar", 'g', "feature grammar (.fcfg)");
    p.add<std::string>("format", 'f', "output format [sem,deriv,tree,feat]", false, "sem",
            cmdline::oneof<std::string>("sem", "deriv", "tree", "feat"));
    p.add<std::string>("input", 'i', "input file", false, "");
    p.add<unsigned>("max-edges", '\0', "give up on charts with more edges (0: no limit)", false, 0);
    p.add<unsigned>("max-steps", '\0', "beta reduction step bound", false, kDefaultMaxSteps);
    p.add("all", '\0', "print the reading of every scope ordering");
    p.add("unique", '\0', "drop alpha-equivalent readings");
    p.add("debug", '\0', "debugging");
    p.add("help", 'h', "print help");

    if ( !p.parse(argc, argv) || p.exist("help") ) {
        std::cerr << p.error_full() << p.usage();
        return 0;
    }

    LogLevel loglevel = p.exist("debug") ? Debug : Info;
    std::string format = p.get<std::string>("format");

#ifdef _OPENMP
    std::cerr << "OpenMP : On, threads = " << omp_get_max_threads() << std::endl;
    if ( p.exist("debug") )
        omp_set_num_threads(1);
#endif

    ParserLogger logger(loglevel);
    logger.RecordTime("time_start_loading");
    logger(Info) << "loading grammar " + p.get<std::string>("grammar");
    std::unique_ptr<ChartParser> parser;
    try {
        parser.reset(new ChartParser(LoadGrammar(p.get<std::string>("grammar")),
                                     loglevel, p.get<unsigned>("max-edges")));
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    logger.RecordTime("time_end_of_loading");
    logger(Info) << std::to_string(parser->GetGrammar().Size()) + " rules, start symbol "
                    + parser->GetGrammar().Start()->ToStr();

    // Load inputs from stdin
    std::string input;
    std::vector<std::string> inputs;
    if ( p.exist("input") && ! p.get<std::string>("input").empty() ) {
        std::ifstream ifs( p.get<std::string>("input") );
        if(ifs.fail()) {
            std::cerr << "File do not exist: "
                      << p.get<std::string>("input")
                      << std::endl;
            return 1;
        }
        while (std::getline(ifs, input))
            inputs.push_back(input);

    } else {
        while (std::getline(std::cin, input))
            inputs.push_back(input);
    }

    SemanticsComposer composer(p.get<unsigned>("max-steps"));
    try {
        // Parse
        logger.RecordTimeStartRunning();
        std::vector<ParseResult> res = parser->ParseSentences(inputs);
        logger.RecordTimeEndOfParsing();

        // Output
        for (unsigned i = 0; i < res.size(); i++) {
            std::cout << "ID=" << i+1 << std::endl;
            if (res[i].NoParse()) {
                std::cout << "NO PARSE" << std::endl;
                continue;
            }
            for (auto&& parse: res[i].GetParses()) {
                if (format == "sem")
                    PrintReadings(composer, parse, p.exist("all"), p.exist("unique"));
                else if (format == "deriv")
                    std::cout << Derivation(parse) << std::endl;
                else if (format == "tree")
                    std::cout << Bracketed(parse).Get() << std::endl;
                else if (format == "feat")
                    std::cout << parse->GetFeatures()->ToStr() << std::endl;
            }
        }
        logger.RecordTimeEndOfComposition();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    logger.Report();

    return 0;
}
