#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setupLogger(SinkOptions const& options)
    {
        Detail::logger.setup(options);
    }

    void flush()
    {
        Detail::logger.flush();
    }
}
