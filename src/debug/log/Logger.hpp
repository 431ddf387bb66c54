#pragma once

#include <format>
#include <string>
#include <string_view>

#include <hyprutils/cli/Logger.hpp>

#include "../../helpers/memory/Memory.hpp"
#include "../../helpers/env/Env.hpp"

namespace Kcursor::Log {
    class CLogger {
      public:
        CLogger();
        ~CLogger() = default;

        void log(Hyprutils::CLI::eLogLevel level, const std::string_view& str);

        template <typename... Args>
        //NOLINTNEXTLINE
        void log(Hyprutils::CLI::eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
            static bool TRACE = Env::isTrace();

            if (!m_logsEnabled)
                return;

            if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
                return;

            // std::format_string<Args...> is checked at compile time, vformat won't throw std::format_error here
            log(level, std::vformat(fmt.get(), std::make_format_args(args...)));
        }

        bool                     enabled() const;
        const std::string&       rolling();
        Hyprutils::CLI::CLogger& hu();

      private:
        void                    recheckEnv();

        Hyprutils::CLI::CLogger m_logger;
        bool                    m_logsEnabled = true;
    };

    inline UP<CLogger> logger = makeUnique<CLogger>();

    //
    inline constexpr const Hyprutils::CLI::eLogLevel DEBUG = Hyprutils::CLI::LOG_DEBUG;
    inline constexpr const Hyprutils::CLI::eLogLevel WARN  = Hyprutils::CLI::LOG_WARN;
    inline constexpr const Hyprutils::CLI::eLogLevel ERR   = Hyprutils::CLI::LOG_ERR;
    inline constexpr const Hyprutils::CLI::eLogLevel CRIT  = Hyprutils::CLI::LOG_CRIT;
    inline constexpr const Hyprutils::CLI::eLogLevel INFO  = Hyprutils::CLI::LOG_DEBUG;
    inline constexpr const Hyprutils::CLI::eLogLevel TRACE = Hyprutils::CLI::LOG_TRACE;
};
