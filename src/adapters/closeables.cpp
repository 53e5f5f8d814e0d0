#include "closeables.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace grace::adapters {

auto FunctionCloseable::close() -> infra::VoidResult {
    if (!fn_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
                                                 "no close function"));
    }
    return fn_();
}

FileResource::FileResource(std::filesystem::path path, std::ofstream out)
    : path_(std::move(path)), out_(std::move(out)) {}

auto FileResource::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<FileResource>>
{
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceOpenFailure,
            fmt::format("cannot open {} for writing", path.string())));
    }
    spdlog::debug("Opened {}", path.string());
    return std::unique_ptr<FileResource>(new FileResource(path, std::move(out)));
}

auto FileResource::write_line(std::string_view line) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    if (!out_.is_open()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
            fmt::format("{} is already closed", path_.string())));
    }
    out_ << line << '\n';
    if (!out_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
            fmt::format("write to {} failed", path_.string())));
    }
    return {};
}

auto FileResource::close() -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    if (!out_.is_open()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
            fmt::format("{} is already closed", path_.string())));
    }
    out_.flush();
    const bool flushed = static_cast<bool>(out_);
    out_.close();
    if (!flushed || out_.fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResourceCloseFailure,
            fmt::format("flush of {} failed", path_.string())));
    }
    return {};
}

auto FileResource::is_open() const -> bool {
    std::lock_guard lock(mutex_);
    return out_.is_open();
}

} // namespace grace::adapters
