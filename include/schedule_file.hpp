#pragma once

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <asio.hpp>
#include <asio/stream_file.hpp>

using asio::awaitable;

// Spawns func on io_context and runs it to completion on this thread,
// rethrowing anything the coroutine threw.
template <typename Func> void run_to_completion(asio::io_context& io_context, Func&& func) {
    std::exception_ptr eptr;

    co_spawn(io_context, std::forward<Func>(func), [&](std::exception_ptr ep) {
        if (ep) {
            eptr = ep;
        }
    });

    io_context.run();

    if (eptr) {
        std::rethrow_exception(eptr);
    }
}

// A calendar export opened read-only.
class ScheduleFile {
  public:
    ScheduleFile(asio::io_context& io_service, const std::filesystem::path& path);
    ~ScheduleFile();

    awaitable<std::string> read_all();
    const std::filesystem::path& get_path() const { return _path; }

  private:
    asio::stream_file _file;
    const std::filesystem::path _path;
};

// Written next to the destination and renamed over it on close(), so a
// failed run never leaves a truncated schedule behind.
class OutputFile {
  public:
    OutputFile(asio::io_context& io_service, const std::filesystem::path& path);
    ~OutputFile();

    awaitable<size_t> write(const std::string_view sv);
    const std::filesystem::path& get_tmp_path() const { return _tmp_path; }

    [[nodiscard]] bool close();

  private:
    asio::stream_file _file;
    const std::filesystem::path _tmp_path;
    const std::filesystem::path _final_path;
    bool _finished{false};
};
