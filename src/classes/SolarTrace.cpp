#include "SolarTrace.hpp"

#include <cstdarg>
#include <cstdio>

void StderrTrace::message(TraceLevel level, const std::string &msg)
{
    if (level == TRACE_DEBUG) {
        if (!verbose_) {
            return;
        }
        fprintf(stdout, "* \t %s\n", msg.c_str());
        return;
    }
    fprintf(stderr, "%s: %s\n", TraceLevelName(level), msg.c_str());
}

void RecordingTrace::message(TraceLevel level, const std::string &msg)
{
    Entry e;
    e.level = level;
    e.text = msg;
    entries_.push_back(e);
}

int RecordingTrace::count(TraceLevel level) const
{
    int n = 0;
    for (const Entry &e : entries_) {
        if (e.level == level) {
            n++;
        }
    }
    return n;
}

void tracef(SolarTrace *trace, TraceLevel level, const char *fmt, ...)
{
    if (trace == nullptr || fmt == nullptr) {
        return;
    }
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    trace->message(level, std::string(buf));
}
