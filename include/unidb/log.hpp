// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Log() -- the library's spdlog logger.
//
// Design:
//   - One named logger "unidb" shared by every connector
//   - A host that registers its own "unidb" logger before first use wins
//   - Otherwise a stderr color logger at info level is created lazily

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace unidb {

constexpr const char* kLoggerName = "unidb";

inline spdlog::logger& Log() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing) { return existing; }
    auto created = std::make_shared<spdlog::logger>(
        kLoggerName,
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    created->set_level(spdlog::level::info);
    spdlog::register_logger(created);
    return created;
  }();
  return *logger;
}

}  // namespace unidb
