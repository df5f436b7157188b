#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lanscan::core::common::log {

enum class Level : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Fatal = 5
};

const char* ToString(Level level);
std::optional<Level> ParseLevel(std::string_view s);

struct Event {
  Level level{};
  std::chrono::system_clock::time_point ts{};
  std::string message;
  std::string tag;
};

class Sink {
public:
  virtual ~Sink() = default;
  virtual void Write(const Event& e) = 0;
  virtual void Flush() {}
};

class Logger {
public:
  explicit Logger(std::shared_ptr<Sink> sink);

  void SetLevel(Level level);
  Level GetLevel() const;
  bool Enabled(Level level) const;

  void Log(Level level, std::string_view msg);
  void Log(Level level, std::string_view tag, std::string_view msg);

  void Trace(std::string_view msg);
  void Debug(std::string_view msg);
  void Info(std::string_view msg);
  void Warn(std::string_view msg);
  void Error(std::string_view msg);
  void Fatal(std::string_view msg);

  void Flush();

private:
  bool ShouldLog(Level level) const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<Sink> sink_;
  Level level_{Level::Info};
};

// Prefixes every message with a fixed component tag.
class TaggedLogger {
public:
  TaggedLogger() = default;
  TaggedLogger(std::shared_ptr<Logger> logger, std::string tag)
      : logger_(std::move(logger)), tag_(std::move(tag)) {}

  bool Enabled(Level level) const { return logger_ && logger_->Enabled(level); }

  void Trace(std::string_view msg) const { Log(Level::Trace, msg); }
  void Debug(std::string_view msg) const { Log(Level::Debug, msg); }
  void Info(std::string_view msg) const { Log(Level::Info, msg); }
  void Warn(std::string_view msg) const { Log(Level::Warn, msg); }
  void Error(std::string_view msg) const { Log(Level::Error, msg); }

private:
  void Log(Level level, std::string_view msg) const {
    if (logger_) logger_->Log(level, tag_, msg);
  }

  std::shared_ptr<Logger> logger_;
  std::string tag_;
};

class FileSink final : public Sink {
public:
  explicit FileSink(std::filesystem::path file_path);

  void Write(const Event& e) override;
  void Flush() override;

  std::filesystem::path Path() const;

private:
  mutable std::mutex mu_;
  std::filesystem::path file_path_;
};

class ConsoleSink final : public Sink {
public:
  void Write(const Event& e) override;
  void Flush() override;

private:
  std::mutex mu_;
};

// Fans one event out to several sinks.
class TeeSink final : public Sink {
public:
  TeeSink(std::shared_ptr<Sink> a, std::shared_ptr<Sink> b) : a_(std::move(a)), b_(std::move(b)) {}

  void Write(const Event& e) override {
    if (a_) a_->Write(e);
    if (b_) b_->Write(e);
  }
  void Flush() override {
    if (a_) a_->Flush();
    if (b_) b_->Flush();
  }

private:
  std::shared_ptr<Sink> a_;
  std::shared_ptr<Sink> b_;
};

std::string FormatLine(const Event& e);

}  // namespace lanscan::core::common::log
