#include "Logging.h"

namespace logger {

    std::atomic<int> Verbosity(WARNING);

    void SetVerbosity(int lvl){
        if(lvl < 0){
            throw std::invalid_argument("Attempt to set a negative logging verbosity");
        }
        Verbosity = lvl;
    }

    int GetVerbosity(){
        return Verbosity;
    }

    const char * LevelName(int lvl){
        switch(lvl){
            case ERROR:
                return "ERROR";
            case WARNING:
                return "WARNING";
            case INFO:
                return "INFO";
            case DEBUG:
            default:
                return "DEBUG";
        }
    }

}
