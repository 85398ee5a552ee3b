#include "log.hpp"

void applyLogLevel(LogLevel level) {
    SDL_LogPriority p = SDL_LOG_PRIORITY_WARN;
    switch (level) {
        case LogLevel::Quiet: p = SDL_LOG_PRIORITY_WARN; break;
        case LogLevel::Info:  p = SDL_LOG_PRIORITY_INFO; break;
        case LogLevel::Debug: p = SDL_LOG_PRIORITY_DEBUG; break;
    }
    SDL_LogSetPriority(LOG_APP, p);
    SDL_LogSetPriority(LOG_GEN, p);
}
