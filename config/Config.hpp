#pragma once

#include <stdlib.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <unsorted/Log4cxx.hpp>

namespace Config {

    inline log4cxx::LoggerPtr sLogger = Logger::Get("property");

    inline std::string getEnv(const char* aName)
    {
        std::string sTmp;
        if (auto sPtr = getenv(aName); sPtr != nullptr)
            sTmp.assign(sPtr);
        return sTmp;
    }

    // replace ${NAME} with environment variable
    inline std::string expandEnv(const std::string& aStr)
    {
        static const std::regex     sExpr("\\$\\{([^}]+)\\}");
        std::string                 sResult;
        std::string::const_iterator sIt = aStr.begin(), sEnd = aStr.end();
        for (std::smatch sMatch; std::regex_search(sIt, sEnd, sMatch, sExpr); sIt = sMatch[0].second) {
            sResult += sMatch.prefix();
            sResult += getEnv(sMatch[1].str().c_str());
        }
        sResult.append(sIt, sEnd);
        return sResult;
    }

    inline void trim(std::string_view& s)
    {
        while (!s.empty() and std::isspace(s.front()))
            s.remove_prefix(1);
        while (!s.empty() and std::isspace(s.back()))
            s.remove_suffix(1);
    }

    template <class T>
    T parseNumber(std::string_view aStr)
    {
        trim(aStr);
        T    sValue = 0;
        auto sEnd   = aStr.data() + aStr.size();
        auto [sPtr, sError] = std::from_chars(aStr.data(), sEnd, sValue);
        if (sError != std::errc() or sPtr != sEnd or aStr.empty())
            throw std::invalid_argument("not a number: " + std::string(aStr));
        return sValue;
    }

    // 250ms, 30s, 5m, 1h. bare number is milliseconds
    inline std::chrono::milliseconds parseDuration(std::string_view aStr)
    {
        trim(aStr);
        int64_t sValue = 0;
        auto    sEnd   = aStr.data() + aStr.size();
        auto [sPtr, sError] = std::from_chars(aStr.data(), sEnd, sValue);
        if (sError != std::errc() or sPtr == aStr.data())
            throw std::invalid_argument("bad duration: " + std::string(aStr));

        std::string_view sUnit(sPtr, sEnd - sPtr);
        trim(sUnit);
        if (sUnit.empty() or sUnit == "ms")
            return std::chrono::milliseconds(sValue);
        if (sUnit == "s")
            return std::chrono::seconds(sValue);
        if (sUnit == "m")
            return std::chrono::minutes(sValue);
        if (sUnit == "h")
            return std::chrono::hours(sValue);
        throw std::invalid_argument("bad duration unit: " + std::string(aStr));
    }

    class PropertyFile
    {
        using Map = std::map<std::string, std::string>;
        Map m_Params;

        void read_file(const std::string& aFilename)
        {
            INFO("read properties from " << aFilename);
            std::ifstream sStream(aFilename);
            if (!sStream)
                throw std::runtime_error("fail to open properties file " + aFilename);
            for (std::string sLine; std::getline(sStream, sLine);) {
                auto [sParam, sValue] = parse(sLine);
                if (!sParam.empty() and !sValue.empty())
                    m_Params[std::string(sParam)] = expandEnv(std::string(sValue));
            }
        }

        std::string wild_get(const std::string& aName) const
        {
            size_t sPos = 0;
            while (true) {
                size_t sSep = aName.find_first_of(":.", sPos);
                if (sSep == std::string::npos)
                    break;
                std::string sTmp = aName;
                sTmp.replace(sPos, sSep - sPos, "*");
                DEBUG("try wildcard match " << sTmp);
                auto sIt = m_Params.find(sTmp);
                if (sIt != m_Params.end()) {
                    return sIt->second;
                }
                sPos = sSep + 1;
            }
            return {};
        }

    public:
        // list of files separated by ':', later files override earlier
        PropertyFile(const std::string& aFilenames)
        {
            size_t sPos = 0;
            while (sPos < aFilenames.size()) {
                size_t sSep = aFilenames.find(':', sPos);
                if (sSep == std::string::npos)
                    sSep = aFilenames.size();
                if (sSep > sPos)
                    read_file(aFilenames.substr(sPos, sSep - sPos));
                sPos = sSep + 1;
            }
        }
        std::string get(const std::string& aName) const
        {
            auto sIt = m_Params.find(aName);
            if (sIt == m_Params.end()) {
                return wild_get(aName);
            }
            return sIt->second;
        }

#ifdef BOOST_TEST_MODULE
        void set(const std::string& aName, const std::string& aValue)
        {
            m_Params[aName] = aValue;
        }

    public:
#endif
        static std::pair<std::string_view, std::string_view> parse(std::string_view aStr)
        {
            trim(aStr);
            if (aStr.empty())
                return {};
            if (aStr.starts_with("#"))
                return {};
            std::string_view sParam;
            std::string_view sValue;

            size_t sPos = aStr.find('=');
            if (sPos != std::string_view::npos) {
                sParam = aStr.substr(0, sPos);
                trim(sParam);
                sValue = aStr.substr(sPos + 1);
                trim(sValue);
            } else
                throw std::invalid_argument("bad property: " + std::string(aStr));

            return std::make_pair(sParam, sValue);
        }
    };

    class Context
    {
        static thread_local std::string m_Name;

    public:
        Context(const std::string& aName)
        {
            if (!m_Name.empty())
                m_Name.push_back('.');
            m_Name.append(aName);
        }

        ~Context()
        {
            const size_t sPos = m_Name.find_last_of('.');
            if (sPos == std::string::npos)
                m_Name.clear();
            else
                m_Name.erase(sPos);
        }

        static const std::string& get()
        {
            return m_Name;
        }
    };

    inline thread_local std::string Context::m_Name;

    class Manager
    {
        PropertyFile m_Properties;

        static std::string detectFileName()
        {
            const std::string sEnv = getEnv("PROPERTIES");
            if (!sEnv.empty())
                return sEnv;
            const std::string sDefault("default.properties");
            if (std::filesystem::exists(sDefault))
                return sDefault;
            return {};
        }

        // cache:refresh.workers -> CACHE__REFRESH_WORKERS
        static std::string envName(const std::string& aParamName)
        {
            std::string sResult;
            for (char c : aParamName) {
                if (c == ':')
                    sResult.append("__");
                else if (c == '.')
                    sResult.push_back('_');
                else
                    sResult.push_back(std::toupper(static_cast<unsigned char>(c)));
            }
            return sResult;
        }

        std::string get_i(const std::string& aName) const
        {
            std::string_view sCtxName = Context::get();

            while (true) {
                std::string sPropertyName;
                if (!sCtxName.empty())
                    sPropertyName += std::string(sCtxName) + ':';
                sPropertyName.append(aName);
                std::string sEnvName = envName(sPropertyName);

                std::string sEnvVal = getEnv(sEnvName.c_str());
                DEBUG("lookup environment: " << sEnvName << " = " << sEnvVal);
                if (!sEnvVal.empty())
                    return sEnvVal;
                std::string sPropertyVal = m_Properties.get(sPropertyName);
                DEBUG("lookup properties: " << sPropertyName << " = " << sPropertyVal);
                if (!sPropertyVal.empty())
                    return sPropertyVal;

                if (sCtxName.empty())
                    break;

                // trim last element of context name and retry
                size_t sPos = sCtxName.rfind('.');
                if (sPos != std::string_view::npos)
                    sCtxName.remove_suffix(sCtxName.size() - sPos);
                else
                    sCtxName = {};
            }
            return {};
        }

    public:
        Manager(const std::string& aFilename = detectFileName())
        : m_Properties(aFilename)
        {
            INFO("manager created");
        }

        std::string get(const std::string& aName, std::optional<std::string> aDefault = {}) const
        {
            std::string sResult = get_i(aName);
            if (!sResult.empty())
                return sResult;

            if (aDefault.has_value()) {
                DEBUG("property " << aName << " not configured, use default value: " << *aDefault);
                return *aDefault;
            }
            ERROR("required property " << aName << " not found");
            throw std::invalid_argument("required property " + aName + " not found");
        }

        std::chrono::milliseconds duration(const std::string& aName, std::optional<std::chrono::milliseconds> aDefault = {}) const
        {
            std::string sResult = get_i(aName);
            if (sResult.empty() and aDefault.has_value())
                return *aDefault;
            return parseDuration(sResult.empty() ? get(aName) : sResult);
        }

        template <class T>
        T number(const std::string& aName, std::optional<T> aDefault = {}) const
        {
            std::string sResult = get_i(aName);
            if (sResult.empty() and aDefault.has_value())
                return *aDefault;
            return parseNumber<T>(sResult.empty() ? get(aName) : sResult);
        }

#ifdef BOOST_TEST_MODULE
        PropertyFile& properties()
        {
            return m_Properties;
        }
#endif
    };

} // namespace Config
