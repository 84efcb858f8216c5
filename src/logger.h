
#ifndef INCLUDE_SEMCHART_LOGGER_H_
#define INCLUDE_SEMCHART_LOGGER_H_

#include <chrono>
#include <iostream>
#include <string>
#include <unordered_map>
#include "tree.h"

#define GREENCOLOR "\033[32m"
#define BLACKCOLOR "\033[93m"
#define REDCOLOR "\033[31m"
#define BLUECOLOR "\033[34m"
#define CYANCOLOR "\033[36m"

namespace semchart {

template<typename T>
struct Color
{
    Color(const T& ob, const char* color)
        :ob_(ob), color_(color) {}

    T ob_;
    const char* color_;
};

template<typename T> Color<T> Blue(T ob) { return Color<T>(ob, BLUECOLOR); }
template<typename T> Color<T> Red(T ob) { return Color<T>(ob, REDCOLOR); }
template<typename T> Color<T> Green(T ob) { return Color<T>(ob, GREENCOLOR); }
template<typename T> Color<T> Cyan(T ob) { return Color<T>(ob, CYANCOLOR); }

template<typename T>
std::ostream& operator<<(std::ostream& out, const Color<T>& color) {
    return out << color.color_ << color.ob_ << "\033[0m";
}

enum LogLevel { Debug, Info, Warn, Error };

// writes to stderr. messages below the configured level are dropped:
//   logger_(Info) << "parsing " + std::to_string(n) + " sentences";
class ParserLogger
{
public:
    ParserLogger(LogLevel level);

    LogLevel GetLevel() const { return level_; }

    ParserLogger& operator()(LogLevel level) {
        cur_level_ = level;
        return *this;
    }

    void RecordTime(const std::string& name);
    void RecordTimeStartRunning();
    void RecordTimeEndOfParsing();
    void RecordTimeEndOfComposition();

    void RecordEdge(const char* message, const Edge* edge);

    void Report();

    void CompleteOne();

    template<typename T> ParserLogger& operator<<(const T& message) {
        if (cur_level_ >= level_)
            std::cerr << "[LOG] " << message << std::endl;
        return *this;
    }

    template<typename T>
    ParserLogger& operator<<(const Color<T>& color) {
        if (cur_level_ >= level_)
            std::cerr << "[LOG] " << color.color_ << color.ob_ << "\033[0m" << std::endl;
        return *this;
    }

private:
    double Seconds(const std::string& from, const std::string& to);

    LogLevel level_;
    LogLevel cur_level_;
    int nprocessed_;
    std::unordered_map<std::string,
        std::chrono::system_clock::time_point> times_;
};

} // namespace semchart

#endif
