// Log.hpp
// Process-wide leveled log sink used for registration and dispatch tracing
#pragma once

#include <NGIN/Dispatch/Export.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace NGIN::Dispatch
{

  enum class LogLevel : int
  {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5,
  };

  [[nodiscard]] constexpr std::string_view ToString(LogLevel level) noexcept
  {
    switch (level)
    {
      case LogLevel::Trace: return "TRACE";
      case LogLevel::Debug: return "DEBUG";
      case LogLevel::Info: return "INFO";
      case LogLevel::Warn: return "WARN";
      case LogLevel::Error: return "ERROR";
      case LogLevel::Off:
      default: break;
    }
    return "OFF";
  }

  /**
   * Custom sink. Receives every message at or above the current level together
   * with the context pointer passed to SetLogSink(). May be called from several
   * threads at once.
   */
  using LogSink = void (*)(LogLevel level, std::string_view message, void *context);

  /** Route messages to `sink`; nullptr restores the stderr sink. */
  NGIN_DISPATCH_API void SetLogSink(LogSink sink, void *context = nullptr);

  /** Equivalent to SetLogSink(nullptr, nullptr). */
  NGIN_DISPATCH_API void ResetLogSink();

  /** Messages below `level` are dropped before they are formatted. Defaults to Off. */
  NGIN_DISPATCH_API void SetLogLevel(LogLevel level) noexcept;
  [[nodiscard]] NGIN_DISPATCH_API LogLevel GetLogLevel() noexcept;

  [[nodiscard]] inline bool IsLogEnabled(LogLevel level) noexcept
  {
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(GetLogLevel());
  }

  namespace detail
  {
    NGIN_DISPATCH_API void LogMessage(LogLevel level, std::string_view message);

    // Builds the message only when the level is enabled.
    template <class MessageBuilder>
    inline void LogLazy(LogLevel level, MessageBuilder &&builder)
    {
      if (IsLogEnabled(level))
      {
        const std::string message = std::forward<MessageBuilder>(builder)();
        LogMessage(level, message);
      }
    }
  } // namespace detail

} // namespace NGIN::Dispatch
