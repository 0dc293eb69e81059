#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <random>
#include <string_view>
#include <system_error>

#include <asio/use_awaitable.hpp>

#include "munger_errors.hpp"
#include "schedule_file.hpp"

using asio::use_awaitable;

// Suffix for the hidden sibling an OutputFile writes before the rename.
static std::string random_suffix(int length) {
    static constexpr auto charset =
        std::string_view{"abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_"};

    static thread_local std::mt19937 rng{std::random_device{}()};
    static thread_local std::uniform_int_distribution<> dist(0, charset.size() - 1);

    std::string result(length, '\0');
    std::ranges::generate(result, [&] { return charset[dist(rng)]; });

    return result;
}

// Creating the stream_file brings up the io_uring service, which throws
// when the kernel or a seccomp filter refuses io_uring_setup.
ScheduleFile::ScheduleFile(asio::io_context& io_service, const std::filesystem::path& path) try
    : _file(io_service), _path(path) {
    asio::error_code ec;

    _file.open(_path.string(), asio::stream_file::read_only, ec);
    if (ec) {
        throw UnreadableFileError(std::format("{}: {}", _path.string(), ec.message()));
    }
} catch (const std::system_error& e) {
    throw UnreadableFileError(std::format("{}: {}", path.string(), e.what()));
}

ScheduleFile::~ScheduleFile() {
    asio::error_code ec;
    ec = _file.close(ec);
}

awaitable<std::string> ScheduleFile::read_all() {
    asio::error_code ec;
    std::string data;

    co_await asio::async_read(_file, asio::dynamic_buffer(data),
                              asio::redirect_error(use_awaitable, ec));

    if (ec && ec != asio::error::eof) {
        throw UnreadableFileError(std::format("{}: {}", _path.string(), ec.message()));
    }

    co_return data;
}

OutputFile::OutputFile(asio::io_context& io_service, const std::filesystem::path& path) try
    : _file(io_service),
      _tmp_path(path.parent_path() / ("." + path.filename().string() + "." + random_suffix(10))),
      _final_path(path) {
    asio::error_code ec;

    _file.open(_tmp_path.string(),
               asio::stream_file::write_only | asio::stream_file::create |
                   asio::stream_file::exclusive,
               ec);
    if (ec) {
        throw UnwritableFileError(std::format("{}: {}", _tmp_path.string(), ec.message()));
    }
} catch (const std::system_error& e) {
    throw UnwritableFileError(std::format("{}: {}", path.string(), e.what()));
}

OutputFile::~OutputFile() {
    asio::error_code ec;

    if (_finished)
        return;

    // MIGHT BLOCK
    unlink(_tmp_path.c_str());

    ec = _file.close(ec);
    _finished = true;
}

awaitable<size_t> OutputFile::write(std::string_view sv) {
    asio::error_code ec;

    size_t size = co_await asio::async_write(_file, asio::buffer(sv.data(), sv.size()),
                                             asio::redirect_error(use_awaitable, ec));
    if (ec) {
        throw UnwritableFileError(std::format("{}: {}", _tmp_path.string(), ec.message()));
    }

    co_return size;
}

bool OutputFile::close() {
    asio::error_code ec;
    std::error_code fs_ec;

    if (_finished)
        return true;

    ec = _file.close(ec);
    if (ec) {
        return false;
    }

    // Replaces an existing destination
    std::filesystem::rename(_tmp_path, _final_path, fs_ec);
    if (fs_ec) {
        return false;
    }

    _finished = true;

    return true;
}
