//  SolarTrace.hpp
//  SolarYield
//
//  Optional trace hook for the estimate engine. Engine functions take a
//  SolarTrace* and stay silent when it is nullptr.
//
#ifndef SolarTrace_hpp
#define SolarTrace_hpp

#include <string>
#include <vector>

enum TraceLevel {
    TRACE_DEBUG = 0,
    TRACE_NOTICE = 1,
    TRACE_WARNING = 2
};

static inline const char *TraceLevelName(TraceLevel level)
{
    switch (level) {
        case TRACE_DEBUG:   return "DEBUG";
        case TRACE_NOTICE:  return "NOTE";
        case TRACE_WARNING: return "WARNING";
        default:            return "UNKNOWN";
    }
}

class SolarTrace {
public:
    virtual ~SolarTrace() = default;
    virtual void message(TraceLevel level, const std::string &msg) = 0;
};

/* WARNING/NOTE always go to stderr; DEBUG only when verbose. */
class StderrTrace final : public SolarTrace {
public:
    explicit StderrTrace(int verbose = 0) : verbose_(verbose) {}

    void message(TraceLevel level, const std::string &msg) override;

private:
    int verbose_ = 0;
};

/* Keeps every message in memory. */
class RecordingTrace final : public SolarTrace {
public:
    struct Entry {
        TraceLevel level;
        std::string text;
    };

    void message(TraceLevel level, const std::string &msg) override;

    int count(TraceLevel level) const;
    const std::vector<Entry> &entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};

/* printf-style helper; no-op when trace is nullptr. */
void tracef(SolarTrace *trace, TraceLevel level, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#endif /* SolarTrace_hpp */
