#ifndef PROBKIT_LOGGING_H
#define PROBKIT_LOGGING_H

#pragma GCC diagnostic ignored "-Wformat-security"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace logger {

    enum LogLevel {ERROR = 1, WARNING = 2, INFO = 3, DEBUG = 4};

    extern std::atomic<int> Verbosity;

    void SetVerbosity(int lvl);
    int GetVerbosity();
    const char * LevelName(int lvl);

    template<typename ... Args>
    void Log(const char * format, int lvl, Args ... args){
        if(lvl > Verbosity || lvl <= 0){
            return;
        }
        std::string header("[probkit::");
        header += LevelName(lvl);
        header += "] ";
        std::string fullFormat = header + format;
        int size_s = std::snprintf(nullptr, 0, fullFormat.c_str(), args ... ) + 1; // Extra space for '\0'
        if( size_s <= 0 ){ throw std::runtime_error( "Error during formatting." ); }
        auto size = static_cast<size_t>( size_s );
        std::unique_ptr<char[]> buf( new char[ size ] );
        std::snprintf( buf.get(), size, fullFormat.c_str(), args ... );
        auto t = std::time(nullptr);
        auto tm = *std::localtime(&t);
        std::stringstream stream;
        stream << std::put_time(&tm,"(%m-%d %H:%M:%S) ") << std::string(buf.get(), buf.get() + size - 1) << "\n";
        std::cerr << stream.str();
    }

}

#endif //PROBKIT_LOGGING_H
