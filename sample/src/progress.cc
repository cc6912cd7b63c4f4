#include <stdarg.h>
#include <stdio.h>
#include <wchar.h>
#include "progress.hh"

Progress::Progress() : last_progress_(0)
{
}

void Progress::set_progress(unsigned char progress)
{
    // Only report every tenth percent.
    if (progress / 10 != last_progress_ / 10 || progress == 100)
        printf("%u%%\n",(unsigned int)progress);

    last_progress_ = progress;
}

void Progress::set_marquee(bool marquee)
{
}

void Progress::set_status(const ckcore::tchar *format,...)
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

void Progress::notify(MessageType type,const ckcore::tchar *format,...)
{
    switch (type)
    {
        case ckWARNING:
            fprintf(stderr,"Warning: ");
            break;

        case ckERROR:
            fprintf(stderr,"Error: ");
            break;

        default:
            break;
    }

    va_list args;
    va_start(args,format);
#ifdef _UNICODE
    vfwprintf(stderr,format,args);
#else
    vfprintf(stderr,format,args);
#endif
    va_end(args);

    fprintf(stderr,"\n");
}

bool Progress::cancelled()
{
    return false;
}
