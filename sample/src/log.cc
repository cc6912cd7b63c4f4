#include <stdarg.h>
#include <stdio.h>
#include <wchar.h>
#include "log.hh"

void Log::print(const ckcore::tchar *format,...)
{
    va_list args;
    va_start(args,format);
#ifdef _UNICODE
    vwprintf(format,args);
#else
    vprintf(format,args);
#endif
    va_end(args);
}

void Log::print_line(const ckcore::tchar *format,...)
{
    va_list args;
    va_start(args,format);
#ifdef _UNICODE
    vwprintf(format,args);
#else
    vprintf(format,args);
#endif
    va_end(args);

    printf("\n");
}
