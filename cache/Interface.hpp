#pragma once

#include <chrono>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <exception/Error.hpp>
#include <unsorted/Log4cxx.hpp>

namespace Cache {

    inline log4cxx::LoggerPtr sLogger = Logger::Get("cache");

    using Duration = std::chrono::milliseconds;

    // key is absent (or expired) in store
    struct NotFoundTag;
    using NotFound = Exception::Error<NotFoundTag>;

    struct Options
    {
        Duration                 expiration{0}; // 0: default of store/wrapper
        std::vector<std::string> tags{};
    };

    struct InvalidateOptions
    {
        std::vector<std::string> tags{};
    };

    // key/value cache: backend or decorator over another cache
    template <class Key, class Value>
    class Interface
    {
    public:
        // value and remaining time to live
        using ValueTTL = std::pair<Value, Duration>;

        virtual Value       Get(const Key& aKey)                                               = 0;
        virtual ValueTTL    GetWithTTL(const Key& aKey)                                        = 0;
        virtual void        Set(const Key& aKey, const Value& aValue, const Options& aOptions = {}) = 0;
        virtual void        Delete(const Key& aKey)                                            = 0;
        virtual void        Invalidate(const InvalidateOptions& aOptions)                      = 0;
        virtual void        Clear()                                                            = 0;
        virtual std::string GetType() const                                                    = 0;

        virtual ~Interface() {}
    };

    // key as text for log messages
    template <class T>
    std::string printable(const T& aKey)
    {
        if constexpr (requires(std::ostream& aStream, const T& aValue) { aStream << aValue; }) {
            std::ostringstream sStream;
            sStream << aKey;
            return sStream.str();
        } else {
            return "<key>";
        }
    }
} // namespace Cache
