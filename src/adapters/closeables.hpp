#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "../core/shutdown/closeable.hpp"
#include "../infra/error_handler/error.hpp"

namespace grace::adapters {

// Любая функция закрытия как Closeable (лямбда над клиентом, сокетом и т.п.)
class FunctionCloseable final : public core::Closeable {
public:
    using CloseFn = std::function<infra::VoidResult()>;

    explicit FunctionCloseable(CloseFn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] auto close() -> infra::VoidResult override;

private:
    CloseFn fn_;
};

/// Файл, открытый на запись на всё время работы процесса.
/// close() сбрасывает буферы и закрывает поток; повторный close() возвращает ошибку.
class FileResource final : public core::Closeable {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<FileResource>>;

    [[nodiscard]] auto write_line(std::string_view line) -> infra::VoidResult;
    [[nodiscard]] auto close() -> infra::VoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto is_open() const -> bool;

private:
    FileResource(std::filesystem::path path, std::ofstream out);

    std::filesystem::path path_;
    std::ofstream out_;
    mutable std::mutex mutex_; // пишет воркер, закрывает главный поток
};

} // namespace grace::adapters
