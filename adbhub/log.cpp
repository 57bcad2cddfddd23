//
//  log.cpp
//  adbhub
//
//  Created on 17.05.25.
//

#include "log.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>
#include <sys/time.h>
#include <time.h>

#include <mutex>

unsigned int log_level = LL_WARNING;

static int log_syslog = 0;
static std::mutex gLogLck;

void log_enable_syslog(void){
    std::unique_lock<std::mutex> ul(gLogLck);
    if (!log_syslog) {
        openlog("adbhub", LOG_PID, 0);
        log_syslog = 1;
    }
}

void log_disable_syslog(void){
    std::unique_lock<std::mutex> ul(gLogLck);
    if (log_syslog) {
        closelog();
        log_syslog = 0;
    }
}

static int level_to_syslog_level(int level){
    switch (level) {
        case LL_FATAL:
            return LOG_CRIT;
        case LL_ERROR:
            return LOG_ERR;
        case LL_WARNING:
            return LOG_WARNING;
        case LL_NOTICE:
            return LOG_NOTICE;
        case LL_INFO:
            return LOG_INFO;
        default:
            return LOG_DEBUG;
    }
}

const char *log_level_name(enum loglevel level){
    switch (level) {
        case LL_FATAL:      return "FATAL";
        case LL_ERROR:      return "ERROR";
        case LL_WARNING:    return "WARNING";
        case LL_NOTICE:     return "NOTICE";
        case LL_INFO:       return "INFO";
        default:            return "DEBUG";
    }
}

void adbhub_log(enum loglevel level, const char *fmt, ...){
    va_list ap;
    char *fs = NULL;
    struct timeval ts = {};
    struct tm tp = {};

    if ((unsigned int)level > log_level)
        return;

    gettimeofday(&ts, NULL);
    localtime_r(&ts.tv_sec, &tp);

    if (asprintf(&fs, "[%02d:%02d:%02d.%03d][%s] %s\n", tp.tm_hour, tp.tm_min, tp.tm_sec, (int)(ts.tv_usec / 1000), log_level_name(level), fmt) < 0)
        return;

    std::unique_lock<std::mutex> ul(gLogLck);
    va_start(ap, fmt);
    if (log_syslog) {
        vsyslog(level_to_syslog_level(level), fs+14, ap); //syslog adds its own timestamp
    } else {
        vfprintf(stderr, fs, ap);
    }
    va_end(ap);

    free(fs);
}
