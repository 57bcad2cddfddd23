//
//  log.h
//  adbhub
//
//  Created on 17.05.25.
//

#ifndef log_h
#define log_h

#define notice(a ...) adbhub_log(LL_NOTICE,a)
#define info(a ...) adbhub_log(LL_INFO,a)
#define warning(a ...) adbhub_log(LL_WARNING,a)
#define error(a ...) adbhub_log(LL_ERROR,a)
#define fatal(a ...) adbhub_log(LL_FATAL,a)

#ifdef DEBUG
#   define debug(a ...) adbhub_log(LL_DEBUG,a)
#else
#   define debug(a ...)
#endif

enum loglevel {
    LL_FATAL = 0,
    LL_ERROR,
    LL_WARNING,
    LL_INFO,
    LL_NOTICE,
    LL_DEBUG
};

extern unsigned int log_level; //messages above this level are dropped

/*
 Syslog adds its own timestamp and pid, stderr lines get "[HH:MM:SS.mmm][LEVEL] ".
 */
void log_enable_syslog(void);
void log_disable_syslog(void);

const char *log_level_name(enum loglevel level);

void adbhub_log(enum loglevel level, const char *fmt, ...) __attribute__ ((format (printf, 2, 3)));

#endif /* log_h */
