#include <NGIN/Dispatch/Log.hpp>

#include <atomic>
#include <cstdio>

namespace NGIN::Dispatch
{

  namespace
  {
    std::atomic<LogSink> g_sink{nullptr};
    std::atomic<void *> g_context{nullptr};
    std::atomic<int> g_level{static_cast<int>(LogLevel::Off)};

    // [NGIN.Dispatch][LEVEL] message
    void DefaultSink(LogLevel level, std::string_view message)
    {
      const auto lv = ToString(level);
      std::fprintf(stderr,
                   "[NGIN.Dispatch][%.*s] %.*s\n",
                   static_cast<int>(lv.size()),
                   lv.data(),
                   static_cast<int>(message.size()),
                   message.data());
    }
  } // namespace

  void SetLogSink(LogSink sink, void *context)
  {
    g_context.store(context, std::memory_order_release);
    g_sink.store(sink, std::memory_order_release);
  }

  void ResetLogSink()
  {
    SetLogSink(nullptr, nullptr);
  }

  void SetLogLevel(LogLevel level) noexcept
  {
    g_level.store(static_cast<int>(level), std::memory_order_release);
  }

  LogLevel GetLogLevel() noexcept
  {
    return static_cast<LogLevel>(g_level.load(std::memory_order_acquire));
  }

  namespace detail
  {
    void LogMessage(LogLevel level, std::string_view message)
    {
      if (auto sink = g_sink.load(std::memory_order_acquire))
      {
        sink(level, message, g_context.load(std::memory_order_acquire));
        return;
      }
      DefaultSink(level, message);
    }
  } // namespace detail

} // namespace NGIN::Dispatch
