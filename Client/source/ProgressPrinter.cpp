#include "ProgressPrinter.hpp"

#include "fmt/core.h"

std::string FormatBytes(std::uint64_t bytes)
{
    constexpr std::uint64_t kUnit = 1024;

    if (bytes < kUnit)
        return fmt::format("{} B", bytes);

    std::uint64_t div = kUnit;
    int exp = 0;
    for (std::uint64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
        div *= kUnit;
        exp++;
    }

    return fmt::format("{:.1f} {}B", static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
}

ProgressPrinter::ProgressPrinter(std::string label, std::FILE* out, std::chrono::milliseconds throttle)
    : label_(std::move(label))
    , out_(out)
    , throttle_(throttle)
    , start_(Clock::now())
    , last_render_(start_)
{
}

void ProgressPrinter::Update(const UploadProgress& progress)
{
    last_ = progress;

    const auto now = Clock::now();
    const bool done = progress.bytes_total > 0 && progress.bytes_sent >= progress.bytes_total;
    if (rendered_ && !done && now - last_render_ < throttle_)
        return;

    last_render_ = now;
    Render(progress);
}

void ProgressPrinter::Finish()
{
    if (!out_ || !rendered_)
        return;

    Render(last_);
    std::fputc('\n', out_);
    std::fflush(out_);
    rendered_ = false;
}

std::chrono::milliseconds ProgressPrinter::Elapsed() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
}

void ProgressPrinter::Render(const UploadProgress& progress)
{
    if (!out_)
        return;

    const double ratio = progress.bytes_total == 0
        ? 0.0
        : static_cast<double>(progress.bytes_sent) / static_cast<double>(progress.bytes_total);

    const double seconds = static_cast<double>(Elapsed().count()) / 1000.0;
    const std::uint64_t speed = seconds > 0 ? static_cast<std::uint64_t>(static_cast<double>(progress.bytes_sent) / seconds) : 0;

    fmt::print(out_, "\r{} {:>3.0f}% ({} / {}, {}/s)", label_, ratio * 100.0,
               FormatBytes(progress.bytes_sent), FormatBytes(progress.bytes_total), FormatBytes(speed));
    std::fflush(out_);

    rendered_ = true;
}
